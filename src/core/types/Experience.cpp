#include "core/types/Experience.hpp"

#include <algorithm>

namespace journal::core {

std::string routeToString(AdministrationRoute route) {
    switch (route) {
    case AdministrationRoute::Oral:
        return "Oral";
    case AdministrationRoute::Sublingual:
        return "Sublingual";
    case AdministrationRoute::Buccal:
        return "Buccal";
    case AdministrationRoute::Insufflated:
        return "Insufflated";
    case AdministrationRoute::Rectal:
        return "Rectal";
    case AdministrationRoute::Transdermal:
        return "Transdermal";
    case AdministrationRoute::Subcutaneous:
        return "Subcutaneous";
    case AdministrationRoute::Intramuscular:
        return "Intramuscular";
    case AdministrationRoute::Intravenous:
        return "Intravenous";
    case AdministrationRoute::Smoked:
        return "Smoked";
    case AdministrationRoute::Inhaled:
        return "Inhaled";
    }
    return "Unknown";
}

AdministrationRoute routeFromString(const std::string& str) {
    if (str == "Sublingual")
        return AdministrationRoute::Sublingual;
    if (str == "Buccal")
        return AdministrationRoute::Buccal;
    if (str == "Insufflated")
        return AdministrationRoute::Insufflated;
    if (str == "Rectal")
        return AdministrationRoute::Rectal;
    if (str == "Transdermal")
        return AdministrationRoute::Transdermal;
    if (str == "Subcutaneous")
        return AdministrationRoute::Subcutaneous;
    if (str == "Intramuscular")
        return AdministrationRoute::Intramuscular;
    if (str == "Intravenous")
        return AdministrationRoute::Intravenous;
    if (str == "Smoked")
        return AdministrationRoute::Smoked;
    if (str == "Inhaled")
        return AdministrationRoute::Inhaled;
    return AdministrationRoute::Oral;
}

int64_t toEpochMillis(TimePoint time) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(time.time_since_epoch()).count();
}

TimePoint fromEpochMillis(int64_t millis) {
    return TimePoint(std::chrono::duration_cast<TimePoint::duration>(
        std::chrono::milliseconds(millis)));
}

nlohmann::json Ingestion::toJson() const {
    nlohmann::json j;
    j["id"] = id;
    j["substanceName"] = substanceName;
    j["time"] = toEpochMillis(time);
    j["endTime"] = endTime ? nlohmann::json(toEpochMillis(*endTime)) : nlohmann::json(nullptr);
    j["route"] = routeToString(route);
    j["dose"] = dose ? nlohmann::json(*dose) : nlohmann::json(nullptr);
    j["isDoseAnEstimate"] = isDoseAnEstimate;
    j["units"] = units;
    j["notes"] = notes ? nlohmann::json(*notes) : nlohmann::json(nullptr);
    return j;
}

Ingestion Ingestion::fromJson(const nlohmann::json& j) {
    Ingestion ingestion;
    ingestion.id = j.value("id", int64_t{0});
    ingestion.substanceName = j.at("substanceName").get<std::string>();
    ingestion.time = fromEpochMillis(j.at("time").get<int64_t>());
    if (j.contains("endTime") && !j["endTime"].is_null()) {
        ingestion.endTime = fromEpochMillis(j["endTime"].get<int64_t>());
    }
    ingestion.route = routeFromString(j.value("route", "Oral"));
    if (j.contains("dose") && !j["dose"].is_null()) {
        ingestion.dose = j["dose"].get<double>();
    }
    ingestion.isDoseAnEstimate = j.value("isDoseAnEstimate", false);
    ingestion.units = j.value("units", "");
    if (j.contains("notes") && !j["notes"].is_null()) {
        ingestion.notes = j["notes"].get<std::string>();
    }
    return ingestion;
}

const Ingestion* Experience::findIngestion(const std::string& substanceName) const {
    auto it = std::find_if(ingestions.begin(), ingestions.end(),
        [&substanceName](const Ingestion& ing) { return ing.substanceName == substanceName; });
    return it != ingestions.end() ? &*it : nullptr;
}

std::optional<TimePoint> Experience::effectiveDate() const {
    if (date) {
        return date;
    }
    if (ingestions.empty()) {
        return std::nullopt;
    }
    auto earliest = std::min_element(ingestions.begin(), ingestions.end(),
        [](const Ingestion& a, const Ingestion& b) { return a.time < b.time; });
    return earliest->time;
}

nlohmann::json Experience::toJson() const {
    nlohmann::json j;
    j["id"] = id;
    j["title"] = title;
    j["text"] = text;
    j["date"] = date ? nlohmann::json(toEpochMillis(*date)) : nlohmann::json(nullptr);
    j["location"] = location ? nlohmann::json(*location) : nlohmann::json(nullptr);
    j["overallRating"] = overallRating ? nlohmann::json(*overallRating) : nlohmann::json(nullptr);

    j["ingestions"] = nlohmann::json::array();
    for (const auto& ingestion : ingestions) {
        j["ingestions"].push_back(ingestion.toJson());
    }
    return j;
}

Experience Experience::fromJson(const nlohmann::json& j) {
    Experience experience;
    experience.id = j.value("id", int64_t{0});
    experience.title = j.value("title", "");
    experience.text = j.value("text", "");
    if (j.contains("date") && !j["date"].is_null()) {
        experience.date = fromEpochMillis(j["date"].get<int64_t>());
    }
    if (j.contains("location") && !j["location"].is_null()) {
        experience.location = j["location"].get<std::string>();
    }
    if (j.contains("overallRating") && !j["overallRating"].is_null()) {
        experience.overallRating = j["overallRating"].get<int>();
    }
    if (j.contains("ingestions") && j["ingestions"].is_array()) {
        for (const auto& ingestion : j["ingestions"]) {
            experience.ingestions.push_back(Ingestion::fromJson(ingestion));
        }
    }
    return experience;
}

nlohmann::json Substance::toJson() const {
    return {
        {"name", name},
        {"commonNames", commonNames},
        {"categories", categories},
        {"interactions", interactions}
    };
}

Substance Substance::fromJson(const nlohmann::json& j) {
    Substance substance;
    substance.name = j.at("name").get<std::string>();
    substance.commonNames = j.value("commonNames", std::vector<std::string>{});
    substance.categories = j.value("categories", std::vector<std::string>{});
    substance.interactions = j.value("interactions", std::vector<std::string>{});
    return substance;
}

} // namespace journal::core

//
// Created by gregorian-rayne on 2/11/26.
//

#include "sbt/history/summary_store.hpp"
#include "sbt/utils/file_utils.hpp"

#include <nlohmann/json.hpp>

namespace sbt::history
{
    namespace {

        void put_optional(nlohmann::json& j, const char* key, const std::optional<std::string>& value) {
            if (value) {
                j[key] = *value;
            }
        }

        std::optional<std::string> get_optional(const nlohmann::json& j, const char* key) {
            if (const auto it = j.find(key); it != j.end() && !it->is_null()) {
                return it->get<std::string>();
            }
            return std::nullopt;
        }

        nlohmann::json serialize_defect(const Defect& defect) {
            nlohmann::json j;
            j["report_file"] = defect.report_file;
            put_optional(j, "bug_type", defect.bug_type);
            put_optional(j, "bug_description", defect.bug_description);
            put_optional(j, "bug_category", defect.bug_category);
            put_optional(j, "source_file", defect.source_file);
            if (defect.is_new) {
                j["is_new"] = *defect.is_new;
            }
            return j;
        }

        Defect deserialize_defect(const nlohmann::json& j) {
            Defect defect;
            defect.report_file = j.at("report_file").get<std::string>();
            defect.bug_type = get_optional(j, "bug_type");
            defect.bug_description = get_optional(j, "bug_description");
            defect.bug_category = get_optional(j, "bug_category");
            defect.source_file = get_optional(j, "source_file");
            if (const auto it = j.find("is_new"); it != j.end() && !it->is_null()) {
                defect.is_new = it->get<bool>();
            }
            return defect;
        }

    }  // namespace

    std::string serialize_summary(const RunSummary& summary) {
        nlohmann::json j;
        j["format_version"] = SUMMARY_FORMAT_VERSION;
        j["run"] = summary.run;
        j["defect_count"] = summary.defect_count();

        nlohmann::json defects = nlohmann::json::array();
        for (const auto& defect : summary.defects) {
            defects.push_back(serialize_defect(defect));
        }
        j["defects"] = std::move(defects);

        return j.dump(2);
    }

    Result<RunSummary, Error> deserialize_summary(const std::string_view text) {
        try {
            const auto j = nlohmann::json::parse(text);

            if (!j.is_object()) {
                return Result<RunSummary, Error>::failure(
                    Error::parse_error("Summary is not a JSON object")
                );
            }

            const int version = j.value("format_version", 0);
            if (version < 1 || version > SUMMARY_FORMAT_VERSION) {
                return Result<RunSummary, Error>::failure(
                    Error::parse_error("Unsupported summary format_version " + std::to_string(version))
                );
            }

            RunSummary summary(j.at("run").get<RunId>());

            const auto& defects = j.at("defects");
            if (!defects.is_array()) {
                return Result<RunSummary, Error>::failure(
                    Error::parse_error("Summary 'defects' is not an array")
                );
            }

            summary.defects.reserve(defects.size());
            for (const auto& dj : defects) {
                summary.add(deserialize_defect(dj));
            }

            return Result<RunSummary, Error>::success(std::move(summary));
        } catch (const nlohmann::json::exception& e) {
            return Result<RunSummary, Error>::failure(
                Error::parse_error(std::string("Failed to parse summary JSON: ") + e.what())
            );
        }
    }

    Result<fs::path, Error> save_summary(const fs::path& folder, const RunSummary& summary) {
        const fs::path path = folder / SUMMARY_FILE_NAME;

        if (auto written = file_utils::write_file(path, serialize_summary(summary)); written.is_err()) {
            return Result<fs::path, Error>::failure(written.error());
        }

        return Result<fs::path, Error>::success(path);
    }

    Result<RunSummary, Error> load_summary(const fs::path& summary_file) {
        auto content = file_utils::read_file(summary_file);
        if (content.is_err()) {
            return Result<RunSummary, Error>::failure(content.error());
        }

        auto summary = deserialize_summary(content.value());
        if (summary.is_err()) {
            return Result<RunSummary, Error>::failure(summary.error().with_context(summary_file.string()));
        }
        return summary;
    }

}  // namespace sbt::history

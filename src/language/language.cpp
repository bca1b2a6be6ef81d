#include <subrelease/errors.hpp>
#include <subrelease/internal/normalization.hpp>
#include <subrelease/language/language.hpp>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <fstream>

namespace subrelease {
namespace language {

namespace {

// Copies a string field if present, warning about other value types
void read_string(const nlohmann::json& record, const std::string& key, const char* field,
                 std::string& out) {
    auto it = record.find(field);
    if (it == record.end() || it->is_null()) {
        return;
    }
    if (!it->is_string()) {
        spdlog::warn("[language_table_from_json] '{}': field '{}' is not a string, skipped",
                     key, field);
        return;
    }
    out = it->get<std::string>();
}

}  // namespace

LanguageTable language_table_from_json(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw LanguageTableError("", "expected a JSON object keyed by language");
    }

    LanguageTable table;
    for (const auto& [key, record] : j.items()) {
        if (!record.is_object()) {
            throw LanguageTableError(key, "expected an object");
        }

        LanguageEntry entry;
        entry.key = key;
        read_string(record, key, "iso639", entry.iso639);
        read_string(record, key, "language_code", entry.language_code);
        read_string(record, key, "iso639_3", entry.iso639_3);
        read_string(record, key, "languageName", entry.language_name);
        read_string(record, key, "displayName", entry.display_name);
        read_string(record, key, "originalName", entry.original_name);

        entry.iso639 = normalization::to_lower(entry.iso639);
        entry.language_code = normalization::to_lower(entry.language_code);
        entry.iso639_3 = normalization::to_lower(entry.iso639_3);

        table.emplace(key, std::move(entry));
    }

    spdlog::debug("[language_table_from_json] loaded {} languages", table.size());
    return table;
}

LanguageTable load_language_table(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        throw LanguageTableError("", "file not found: " + path.string());
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        throw LanguageTableError("", "failed to open " + path.string());
    }

    nlohmann::json j;
    try {
        file >> j;
    } catch (const nlohmann::json::parse_error& e) {
        throw LanguageTableError("", path.string() + ": " + e.what());
    }

    return language_table_from_json(j);
}

const LanguageEntry* find_by_code(const LanguageTable& table, std::string_view code) {
    if (code.empty()) {
        return nullptr;
    }
    std::string lower = normalization::to_lower(code);
    for (const auto& [key, entry] : table) {
        if (entry.language_code == lower || entry.iso639 == lower || entry.iso639_3 == lower) {
            return &entry;
        }
    }
    return nullptr;
}

const LanguageEntry* find_by_name(const LanguageTable& table, std::string_view name) {
    if (name.empty()) {
        return nullptr;
    }
    for (const auto& [key, entry] : table) {
        for (const auto* candidate :
             {&entry.language_name, &entry.display_name, &entry.original_name}) {
            if (!candidate->empty() && normalization::iequals(*candidate, name)) {
                return &entry;
            }
        }
    }
    return nullptr;
}

}  // namespace language
}  // namespace subrelease

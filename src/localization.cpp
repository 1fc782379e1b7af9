#include "localization.hpp"
#include "config.hpp"
#include "utils.hpp"
#include <fstream>
#include <unordered_map>
#include <cstdlib>
#include <mutex>
#include <string>

namespace {
    std::unordered_map<std::string, std::string> translations;
    std::unordered_map<std::string, std::string> missing_key_placeholders;
    std::mutex missing_mtx;

    void load_strings(const std::string& lang) {
        const auto file_path = L10N_DIR / (lang + ".txt");
        std::ifstream file(file_path);
        if (!file.is_open()) {
            if (lang != "en") {
                log_warning("Could not open localization file for " + lang + ", falling back to English.");
                load_strings("en");
            }
            return;
        }

        std::string line;
        while (std::getline(file, line)) {
            if (line.empty() || line.front() == '#') continue;
            size_t pos = line.find('=');
            if (pos != std::string::npos) {
                translations[line.substr(0, pos)] = line.substr(pos + 1);
            }
        }
    }
}

void init_localization() {
    if (!translations.empty()) return;
    const char* lang_env = getenv("LANG");
    std::string lang = "en";
    if (lang_env) {
        std::string value(lang_env);
        auto sep = value.find_first_of("_.");
        value = value.substr(0, sep);
        if (!value.empty() && value != "C" && value != "POSIX") lang = value;
    }
    load_strings(lang);
}

const std::string& get_string(const std::string& key) {
    auto it = translations.find(key);
    if (it != translations.end()) {
        return it->second;
    }
    std::lock_guard<std::mutex> lock(missing_mtx);
    auto missing_it = missing_key_placeholders.find(key);
    if (missing_it == missing_key_placeholders.end()) {
        missing_it = missing_key_placeholders.emplace(key, "[MISSING_STRING: " + key + "]").first;
    }
    return missing_it->second;
}

// ============= src/config/simple_toml.cpp =============
#include "config/simple_toml.hpp"
#include <spdlog/spdlog.h>
#include <fstream>
#include <stdexcept>

std::string SimpleToml::trim(const std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

bool SimpleToml::load(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) return false;

    parse(file);
    return true;
}

void SimpleToml::parse(std::istream& input) {
    std::string line, section;
    while (std::getline(input, line)) {
        line = trim(line);
        if (line.empty() || line[0] == '#') continue;

        if (line[0] == '[' && line.back() == ']') {
            section = trim(line.substr(1, line.length() - 2));
            continue;
        }

        auto eq = line.find('=');
        if (eq == std::string::npos) {
            spdlog::warn("toml: linea ignorada '{}'", line);
            continue;
        }

        std::string key = trim(line.substr(0, eq));
        std::string val = trim(line.substr(eq + 1));

        if (val.size() >= 2 && val.front() == '"') {
            auto close = val.find('"', 1);
            if (close != std::string::npos) {
                val = val.substr(1, close - 1);
            }
        } else {
            // comentario al final de la linea
            auto hash = val.find('#');
            if (hash != std::string::npos) {
                val = trim(val.substr(0, hash));
            }
        }

        std::string full_key = section.empty() ? key : section + "." + key;
        values[full_key] = val;
    }
}

bool SimpleToml::has(const std::string& key) const {
    return values.find(key) != values.end();
}

std::string SimpleToml::get(const std::string& key, const std::string& def) const {
    auto it = values.find(key);
    return it != values.end() ? it->second : def;
}

int SimpleToml::get_int(const std::string& key, int def) const {
    if (!has(key)) return def;
    try {
        return std::stoi(get(key));
    } catch (const std::exception&) {
        spdlog::warn("toml: '{}' no es entero ('{}'), usando {}", key, get(key), def);
        return def;
    }
}

float SimpleToml::get_float(const std::string& key, float def) const {
    if (!has(key)) return def;
    try {
        return std::stof(get(key));
    } catch (const std::exception&) {
        spdlog::warn("toml: '{}' no es numero ('{}'), usando {}", key, get(key), def);
        return def;
    }
}

bool SimpleToml::get_bool(const std::string& key, bool def) const {
    if (!has(key)) return def;
    std::string v = get(key);
    return v == "true" || v == "1";
}

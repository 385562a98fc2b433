// ============= include/config/simple_toml.hpp =============
/*
 * SimpleToml - lector minimo de archivos .toml
 *
 * SOPORTA:
 * - [section] -> claves "section.key"
 * - key = value / key = "string"
 * - comentarios con '#'
 *
 * No soporta arrays, tablas inline ni strings multilinea.
 */

#pragma once
#include <istream>
#include <map>
#include <string>

class SimpleToml {
private:
    std::map<std::string, std::string> values;

    static std::string trim(const std::string& s);

public:
    bool load(const std::string& filename);
    void parse(std::istream& input);

    bool has(const std::string& key) const;
    std::string get(const std::string& key, const std::string& def = "") const;
    int get_int(const std::string& key, int def = 0) const;
    float get_float(const std::string& key, float def = 0.0f) const;
    bool get_bool(const std::string& key, bool def = false) const;

    size_t size() const { return values.size(); }
};

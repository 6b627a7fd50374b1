#pragma once

#include <cstddef>
#include <cstdint>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "cargopack/catalog.hpp"

namespace cargopack {

inline std::string require_arg(int& i, int argc, char** argv, const std::string& flag) {
    if (i + 1 >= argc) {
        throw std::runtime_error("Missing value for " + flag + ".");
    }
    return argv[++i];
}

inline int parse_int(const std::string& s) {
    std::size_t pos = 0;
    int v = std::stoi(s, &pos);
    if (pos != s.size()) {
        throw std::runtime_error("Invalid integer: " + s);
    }
    return v;
}

inline std::uint64_t parse_u64(const std::string& s) {
    std::size_t pos = 0;
    std::uint64_t v = std::stoull(s, &pos);
    if (pos != s.size()) {
        throw std::runtime_error("Invalid uint64: " + s);
    }
    return v;
}

inline double parse_double(const std::string& s) {
    std::size_t pos = 0;
    double v = std::stod(s, &pos);
    if (pos != s.size()) {
        throw std::runtime_error("Invalid double: " + s);
    }
    return v;
}

inline std::vector<double> parse_double_list(const std::string& s) {
    std::vector<double> out;
    std::stringstream ss(s);
    std::string item;
    while (std::getline(ss, item, ',')) {
        if (item.empty()) {
            continue;
        }
        out.push_back(parse_double(item));
    }
    return out;
}

// "W,H,D" -> Container (values are validated by the packer).
inline Container parse_container(const std::string& s) {
    const auto v = parse_double_list(s);
    if (v.size() != 3) {
        throw std::runtime_error("Invalid container (expected W,H,D): " + s);
    }
    return Container{v[0], v[1], v[2]};
}

// "electronics=3,standard=5" -> counts.
inline TypeCounts parse_counts(const std::string& s) {
    TypeCounts out;
    std::stringstream ss(s);
    std::string item;
    while (std::getline(ss, item, ',')) {
        if (item.empty()) {
            continue;
        }
        const std::size_t eq = item.find('=');
        if (eq == std::string::npos || eq == 0) {
            throw std::runtime_error("Invalid count (expected type=N): " + item);
        }
        const int n = parse_int(item.substr(eq + 1));
        if (n < 0) {
            throw std::runtime_error("Negative count: " + item);
        }
        out[item.substr(0, eq)] += n;
    }
    return out;
}

}  // namespace cargopack

#include "cargopack/manifest_csv.hpp"

#include <cctype>
#include <iomanip>
#include <set>
#include <stdexcept>
#include <string>
#include <string_view>

namespace cargopack {
namespace {

constexpr std::size_t kManifestColumns = 8;

std::string trim_copy(std::string_view s) {
    std::size_t b = 0;
    while (b < s.size() && std::isspace(static_cast<unsigned char>(s[b]))) {
        ++b;
    }
    std::size_t e = s.size();
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) {
        --e;
    }
    return std::string(s.substr(b, e - b));
}

std::vector<std::string> split_csv(const std::string& line) {
    std::vector<std::string> out;
    std::size_t start = 0;
    while (true) {
        const std::size_t pos = line.find(',', start);
        if (pos == std::string::npos) {
            out.push_back(trim_copy(std::string_view(line).substr(start)));
            break;
        }
        out.push_back(trim_copy(std::string_view(line).substr(start, pos - start)));
        start = pos + 1;
    }
    return out;
}

double parse_number(const std::string& s, const char* what) {
    std::size_t pos = 0;
    double v = 0.0;
    try {
        v = std::stod(s, &pos);
    } catch (const std::exception&) {
        throw std::runtime_error(std::string("invalid ") + what + ": '" + s + "'");
    }
    if (pos != s.size()) {
        throw std::runtime_error(std::string("invalid ") + what + ": '" + s + "'");
    }
    return v;
}

int parse_id(const std::string& s) {
    std::size_t pos = 0;
    int v = 0;
    try {
        v = std::stoi(s, &pos);
    } catch (const std::exception&) {
        throw std::runtime_error("invalid id: '" + s + "'");
    }
    if (pos != s.size()) {
        throw std::runtime_error("invalid id: '" + s + "'");
    }
    return v;
}

bool parse_flag(const std::string& raw) {
    std::string s;
    for (const char c : raw) {
        s.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    if (s == "1" || s == "true" || s == "yes") {
        return true;
    }
    if (s == "0" || s == "false" || s == "no" || s.empty()) {
        return false;
    }
    throw std::runtime_error("invalid fragile flag: '" + raw + "'");
}

}  // namespace

std::vector<Item> read_manifest_csv(std::istream& in) {
    std::vector<Item> items;
    std::set<int> seen;

    std::string line;
    int line_no = 0;
    while (std::getline(in, line)) {
        line_no++;
        const std::string trimmed = trim_copy(line);
        if (trimmed.empty()) {
            continue;
        }
        if (line_no == 1 && (trimmed.rfind("id,", 0) == 0 || trimmed == "id")) {
            continue;
        }

        const auto fields = split_csv(trimmed);
        if (fields.size() != kManifestColumns) {
            throw std::runtime_error("line " + std::to_string(line_no) + ": expected " +
                                     std::to_string(kManifestColumns) + " columns");
        }

        Item item;
        try {
            item.id = parse_id(fields[0]);
            item.category = fields[1];
            item.dims.length = parse_number(fields[2], "length");
            item.dims.width = parse_number(fields[3], "width");
            item.dims.height = parse_number(fields[4], "height");
            item.weight = parse_number(fields[5], "weight");
            item.fragile = parse_flag(fields[6]);
            item.color = fields[7];
        } catch (const std::runtime_error& e) {
            throw std::runtime_error("line " + std::to_string(line_no) + ": " + e.what());
        }

        if (!seen.insert(item.id).second) {
            throw std::runtime_error("line " + std::to_string(line_no) + ": duplicate id " +
                                     std::to_string(item.id));
        }
        items.push_back(item);
    }
    return items;
}

void write_manifest_csv(std::ostream& out, const std::vector<Item>& items) {
    out << "id,category,length,width,height,weight,fragile,color\n";
    out << std::setprecision(17);
    for (const auto& item : items) {
        out << item.id << "," << item.category << "," << item.dims.length << "," << item.dims.width << ","
            << item.dims.height << "," << item.weight << "," << (item.fragile ? 1 : 0) << "," << item.color << "\n";
    }
}

void write_placements_csv(std::ostream& out, const std::vector<PlacedItem>& placed, int precision) {
    if (precision < 0 || precision > 17) {
        throw std::invalid_argument("write_placements_csv: precision must be in [0,17]");
    }
    const auto old_flags = out.flags();
    const auto old_precision = out.precision();

    out << "seq,id,category,dx,dy,dz,weight,x,y,z,orientation,phase,stability\n";
    out << std::fixed << std::setprecision(precision);
    for (std::size_t i = 0; i < placed.size(); ++i) {
        const auto& p = placed[i];
        out << (i + 1) << "," << p.item.id << "," << p.item.category << "," << p.extents.dx << "," << p.extents.dy
            << "," << p.extents.dz << "," << p.item.weight << "," << p.position.x << "," << p.position.y << ","
            << p.position.z << "," << p.orientation << "," << phase_name(p.phase) << "," << p.stability << "\n";
    }

    out.flags(old_flags);
    out.precision(old_precision);
}

}  // namespace cargopack

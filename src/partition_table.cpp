#include "partition_table.hpp"
#include "utils.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <sstream>

namespace imgroot {

namespace {

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

uint64_t parse_number(const std::string& value, const std::string& line) {
    try {
        size_t pos = 0;
        uint64_t n = std::stoull(value, &pos);
        if (pos != value.size()) {
            throw LayoutError("Malformed partition entry: " + line);
        }
        return n;
    } catch (const std::logic_error&) {
        throw LayoutError("Malformed partition entry: " + line);
    }
}

// Номер раздела из имени устройства: "<device>1", "<device>p1" или завершающие цифры
int parse_partition_number(const std::string& name, const std::string& device,
                           const std::string& line) {
    std::string suffix;
    if (!device.empty() && name.size() > device.size() && name.compare(0, device.size(), device) == 0) {
        suffix = name.substr(device.size());
        if (!suffix.empty() && suffix[0] == 'p') {
            suffix.erase(0, 1);
        }
    } else {
        size_t pos = name.size();
        while (pos > 0 && std::isdigit(static_cast<unsigned char>(name[pos - 1]))) {
            --pos;
        }
        suffix = name.substr(pos);
    }

    if (suffix.empty() || !std::all_of(suffix.begin(), suffix.end(),
                                       [](unsigned char c) { return std::isdigit(c); })) {
        throw LayoutError("Cannot determine partition number: " + line);
    }
    return static_cast<int>(parse_number(suffix, line));
}

} // namespace

const Partition* PartitionTable::find(int number) const {
    for (const auto& p : partitions) {
        if (p.number == number) {
            return &p;
        }
    }
    return nullptr;
}

const Partition& PartitionTable::first() const {
    if (partitions.empty()) {
        throw NotFoundError("No partitions found");
    }
    return partitions.front();
}

const Partition& PartitionTable::last() const {
    if (partitions.empty()) {
        throw NotFoundError("No partitions found");
    }
    return partitions.back();
}

void PartitionTable::require_boot_and_root() const {
    if (partitions.size() < 2) {
        throw LayoutError("Image must contain at least 2 partitions (boot and root), found " +
                          std::to_string(partitions.size()));
    }
    if (!find(BOOT_PARTITION) || !find(ROOT_PARTITION)) {
        throw LayoutError("Image has no partition " + std::to_string(BOOT_PARTITION) +
                          " (boot) or " + std::to_string(ROOT_PARTITION) + " (root)");
    }
}

PartitionTable parse_sfdisk_dump(const std::string& text) {
    PartitionTable table;
    std::string device;

    std::istringstream iss(text);
    std::string line;
    while (std::getline(iss, line)) {
        line = trim(line);
        if (line.empty()) continue;

        size_t sep = line.find(" : ");
        if (sep == std::string::npos) {
            // Заголовок: "key: value"
            size_t colon = line.find(':');
            if (colon == std::string::npos) continue;
            std::string key = trim(line.substr(0, colon));
            std::string value = trim(line.substr(colon + 1));

            if (key == "label") {
                table.label = value;
            } else if (key == "label-id") {
                table.label_id = value;
            } else if (key == "device") {
                device = value;
            } else if (key == "sector-size") {
                table.sector_size = parse_number(value, line);
            }
            continue;
        }

        // Раздел: "<name> : start=..., size=..., type=..., bootable"
        Partition p;
        p.number = parse_partition_number(trim(line.substr(0, sep)), device, line);

        bool has_start = false;
        bool has_size = false;
        std::istringstream fields(line.substr(sep + 3));
        std::string field;
        while (std::getline(fields, field, ',')) {
            field = trim(field);
            size_t eq = field.find('=');
            if (eq == std::string::npos) {
                if (field == "bootable") p.bootable = true;
                continue;
            }
            std::string key = trim(field.substr(0, eq));
            std::string value = trim(field.substr(eq + 1));

            if (key == "start") {
                p.start_sectors = parse_number(value, line);
                has_start = true;
            } else if (key == "size") {
                p.size_sectors = parse_number(value, line);
                has_size = true;
            } else if (key == "type" || key == "Id") {
                p.type = value;
            }
        }

        if (!has_start || !has_size) {
            throw LayoutError("Malformed partition entry: " + line);
        }
        table.partitions.push_back(p);
    }

    for (auto& p : table.partitions) {
        p.sector_size = table.sector_size;
    }

    std::stable_sort(table.partitions.begin(), table.partitions.end(),
                     [](const Partition& a, const Partition& b) {
                         return a.start_sectors < b.start_sectors;
                     });
    return table;
}

PartitionTypeNames parse_type_list(const std::string& text) {
    PartitionTypeNames names;

    std::istringstream iss(text);
    std::string line;
    while (std::getline(iss, line)) {
        line = trim(line);
        if (line.empty()) continue;

        size_t space = line.find_first_of(" \t");
        if (space == std::string::npos) continue;

        std::string code = line.substr(0, space);
        std::string name = trim(line.substr(space));

        // Строка заголовка "Id  Name"
        if (code == "Id" && name == "Name") continue;

        names.emplace(to_lower(code), name);
    }
    return names;
}

std::string partition_type_name(const PartitionTypeNames& names, const std::string& code) {
    auto it = names.find(to_lower(code));
    if (it == names.end()) {
        return "unknown";
    }
    return it->second;
}

PartitionTable PartitionTableReader::read(const std::string& image_path) {
    std::string dump;
    try {
        dump = execute_command_output("sfdisk --dump " + shell_quote(image_path));
    } catch (const ImgrootError&) {
        throw LayoutError("Failed to read partition table of " + image_path);
    }

    PartitionTable table = parse_sfdisk_dump(dump);

    if (!table.label.empty()) {
        const PartitionTypeNames& names = type_names(table.label);
        for (auto& p : table.partitions) {
            p.type_name = partition_type_name(names, p.type);
        }
    }

    spdlog::debug("{}: {} table, {} partitions", image_path,
                  table.label.empty() ? "unknown" : table.label, table.size());
    return table;
}

PartitionTypeNames PartitionTableReader::load_type_names(const std::string& label) {
    try {
        return parse_type_list(execute_command_output("sfdisk --label " + shell_quote(label) + " -T"));
    } catch (const ImgrootError& e) {
        // Имена типов только для отображения
        spdlog::warn("Cannot list partition types for {}: {}", label, e.what());
        return {};
    }
}

const PartitionTypeNames& PartitionTableReader::type_names(const std::string& label) {
    auto it = type_cache_.find(label);
    if (it == type_cache_.end()) {
        it = type_cache_.emplace(label, load_type_names(label)).first;
    }
    return it->second;
}

} // namespace imgroot

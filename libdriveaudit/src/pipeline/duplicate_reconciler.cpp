#include "../../include/duplicate_reconciler.hpp"
#include "../../include/logger.hpp"
#include "../../include/string_utils.hpp"
#include "../../include/vendor.hpp"
#include <algorithm>
#include <map>
#include <optional>
#include <set>
#include <tuple>

namespace driveaudit {

static const char* reconciler_tag() {
    return "Reconciler";
}

namespace {

struct FieldAccess {
    const char* name;
    std::optional<std::string> (*render)(const CanonicalDriveRecord&);
    void (*copy)(const CanonicalDriveRecord& from, CanonicalDriveRecord& to);
};

template <typename T>
std::optional<std::string> render_number(const std::optional<T>& v) {
    if (!v) return std::nullopt;
    return std::to_string(*v);
}

std::optional<std::string> render_text(const std::string& s) {
    if (s.empty()) return std::nullopt;
    return s;
}

constexpr FieldAccess kFields[] = {
    {"model",
     [](const CanonicalDriveRecord& r) { return render_text(r.model); },
     [](const CanonicalDriveRecord& f, CanonicalDriveRecord& t) { t.model = f.model; }},
    {"vendor_information",
     [](const CanonicalDriveRecord& r) { return render_text(r.vendor_information); },
     [](const CanonicalDriveRecord& f, CanonicalDriveRecord& t) { t.vendor_information = f.vendor_information; }},
    {"firmware_revision",
     [](const CanonicalDriveRecord& r) { return render_text(r.firmware_revision); },
     [](const CanonicalDriveRecord& f, CanonicalDriveRecord& t) { t.firmware_revision = f.firmware_revision; }},
    {"interface_type",
     [](const CanonicalDriveRecord& r) -> std::optional<std::string> {
         if (r.interface_type == InterfaceType::Unknown) return std::nullopt;
         return std::string(to_string(r.interface_type));
     },
     [](const CanonicalDriveRecord& f, CanonicalDriveRecord& t) { t.interface_type = f.interface_type; }},
    {"capacity_bytes",
     [](const CanonicalDriveRecord& r) -> std::optional<std::string> {
         if (r.capacity_bytes == 0) return std::nullopt;
         return std::to_string(r.capacity_bytes);
     },
     [](const CanonicalDriveRecord& f, CanonicalDriveRecord& t) { t.capacity_bytes = f.capacity_bytes; }},
    {"overall_health",
     [](const CanonicalDriveRecord& r) -> std::optional<std::string> {
         if (r.overall_health == HealthVerdict::Unknown) return std::nullopt;
         return std::string(to_string(r.overall_health));
     },
     [](const CanonicalDriveRecord& f, CanonicalDriveRecord& t) { t.overall_health = f.overall_health; }},
    {"health_percent",
     [](const CanonicalDriveRecord& r) { return render_number(r.health_percent); },
     [](const CanonicalDriveRecord& f, CanonicalDriveRecord& t) { t.health_percent = f.health_percent; }},
    {"temperature_celsius",
     [](const CanonicalDriveRecord& r) { return render_number(r.temperature_celsius); },
     [](const CanonicalDriveRecord& f, CanonicalDriveRecord& t) { t.temperature_celsius = f.temperature_celsius; }},
    {"power_on_hours",
     [](const CanonicalDriveRecord& r) { return render_number(r.power_on_hours); },
     [](const CanonicalDriveRecord& f, CanonicalDriveRecord& t) { t.power_on_hours = f.power_on_hours; }},
    {"reallocated_sectors",
     [](const CanonicalDriveRecord& r) { return render_number(r.reallocated_sectors); },
     [](const CanonicalDriveRecord& f, CanonicalDriveRecord& t) { t.reallocated_sectors = f.reallocated_sectors; }},
    {"grown_defects",
     [](const CanonicalDriveRecord& r) { return render_number(r.grown_defects); },
     [](const CanonicalDriveRecord& f, CanonicalDriveRecord& t) { t.grown_defects = f.grown_defects; }},
};

SourceRef source_of(const CanonicalDriveRecord& r) {
    return SourceRef{r.source_file_name, r.source_format, r.source_index};
}

bool source_less(const SourceRef& a, const SourceRef& b) {
    return std::tie(a.file_name, a.format, a.index) < std::tie(b.file_name, b.format, b.index);
}

std::string render_attribute(const SmartAttribute& a) {
    const auto num = [](const auto& v) { return v ? std::to_string(*v) : std::string("-"); };
    return "raw=" + num(a.raw_value) + " value=" + num(a.normalized_value) + " worst=" + num(a.worst) +
           " threshold=" + num(a.threshold) + " status=" + std::string(to_string(a.status));
}

// collect the values members report for one field; members are in rank order
FieldResolution resolve(const std::string& field,
                        const std::vector<std::pair<std::string, SourceRef>>& values) {
    FieldResolution res;
    res.field = field;
    res.chosen_value = values.front().first;
    res.chosen = values.front().second;

    std::set<std::string> distinct;
    for (const auto& [value, source] : values) {
        distinct.insert(value);
        res.observed.push_back(ObservedValue{value, source});
    }
    res.conflict = distinct.size() > 1;
    std::ranges::sort(res.observed, [](const ObservedValue& a, const ObservedValue& b) {
        if (a.value != b.value) return a.value < b.value;
        return source_less(a.source, b.source);
    });
    return res;
}

ReconciliationGroup merge_group(std::string serial, std::vector<CanonicalDriveRecord> members) {
    std::ranges::sort(members, DuplicateReconciler::outranks);

    ReconciliationGroup group;
    group.serial_number = std::move(serial);

    const CanonicalDriveRecord& top = members.front();
    CanonicalDriveRecord merged;
    merged.serial_number = group.serial_number;
    merged.label_serial = label_serial_of(group.serial_number);
    merged.source_file_name = top.source_file_name;
    merged.source_format = top.source_format;
    merged.source_index = top.source_index;
    merged.source_encoding = top.source_encoding;
    merged.raw_excerpt = top.raw_excerpt;
    for (const auto& m : members) {
        merged.extracted_at = std::max(merged.extracted_at, m.extracted_at);
    }

    for (const FieldAccess& field : kFields) {
        std::vector<std::pair<std::string, SourceRef>> values;
        const CanonicalDriveRecord* provider = nullptr;
        for (const auto& m : members) {
            if (auto v = field.render(m)) {
                values.emplace_back(std::move(*v), source_of(m));
                if (!provider) provider = &m;
            }
        }
        if (!provider) continue;
        field.copy(*provider, merged);
        group.resolutions.push_back(resolve(field.name, values));
    }
    merged.vendor = derive_vendor(merged.model);

    std::set<unsigned> ids;
    for (const auto& m : members) {
        for (const auto& [id, attr] : m.smart_attributes) ids.insert(id);
    }
    for (const unsigned id : ids) {
        std::vector<std::pair<std::string, SourceRef>> values;
        for (const auto& m : members) {
            const auto it = m.smart_attributes.find(id);
            if (it == m.smart_attributes.end()) continue;
            if (values.empty()) merged.smart_attributes.emplace(id, it->second);
            values.emplace_back(render_attribute(it->second), source_of(m));
        }
        group.resolutions.push_back(resolve("smart." + std::to_string(id), values));
    }

    for (const auto& res : group.resolutions) {
        if (res.conflict) {
            Logger::log(LogLevel::Debug,
                        group.serial_number + ": conflicting " + res.field + ", chose \"" + res.chosen_value +
                        "\" from " + res.chosen.file_name, reconciler_tag());
        }
    }

    group.merged = std::move(merged);
    group.members = std::move(members);
    return group;
}

} // namespace

std::string DuplicateReconciler::group_key(const std::string_view serial) {
    return to_upper_copy(trim(serial));
}

std::size_t DuplicateReconciler::completeness(const CanonicalDriveRecord& record) {
    std::size_t n = record.smart_attributes.size();
    for (const FieldAccess& field : kFields) {
        if (field.render(record)) ++n;
    }
    return n;
}

bool DuplicateReconciler::outranks(const CanonicalDriveRecord& a, const CanonicalDriveRecord& b) {
    const std::size_t ca = completeness(a);
    const std::size_t cb = completeness(b);
    if (ca != cb) return ca > cb;
    if (a.extracted_at != b.extracted_at) return a.extracted_at > b.extracted_at;
    const int pa = source_precedence(a.source_format);
    const int pb = source_precedence(b.source_format);
    if (pa != pb) return pa > pb;
    if (a.source_file_name != b.source_file_name) return a.source_file_name < b.source_file_name;
    if (a.source_index != b.source_index) return a.source_index < b.source_index;
    // same provenance (the same file name given twice): order by content so the order stays total
    const auto text = [](const CanonicalDriveRecord& r) {
        return std::tie(r.serial_number, r.model, r.firmware_revision, r.vendor_information,
                        r.source_encoding, r.raw_excerpt);
    };
    if (text(a) != text(b)) return text(a) < text(b);
    const auto values = [](const CanonicalDriveRecord& r) {
        return std::tie(r.interface_type, r.capacity_bytes, r.overall_health, r.health_percent,
                        r.temperature_celsius, r.power_on_hours, r.reallocated_sectors, r.grown_defects);
    };
    if (values(a) != values(b)) return values(a) < values(b);
    return std::ranges::lexicographical_compare(
        a.smart_attributes, b.smart_attributes, [](const auto& x, const auto& y) {
            return std::make_tuple(x.first, x.second.name, render_attribute(x.second)) <
                   std::make_tuple(y.first, y.second.name, render_attribute(y.second));
        });
}

std::vector<ReconciliationGroup> DuplicateReconciler::reconcile(std::vector<CanonicalDriveRecord> records) const {
    std::map<std::string, std::vector<CanonicalDriveRecord>> by_serial;
    const std::size_t total = records.size();
    for (auto& r : records) {
        by_serial[group_key(r.serial_number)].push_back(std::move(r));
    }

    std::vector<ReconciliationGroup> groups;
    groups.reserve(by_serial.size());
    std::size_t conflicting = 0;
    for (auto& [serial, members] : by_serial) {
        groups.push_back(merge_group(serial, std::move(members)));
        if (groups.back().has_conflicts()) ++conflicting;
    }

    Logger::log(LogLevel::Info,
                "Reconciled " + std::to_string(total) + " record(s) into " + std::to_string(groups.size()) +
                " drive(s), " + std::to_string(conflicting) + " with conflicts", reconciler_tag());
    return groups;
}

} // namespace driveaudit

#pragma once
#include <cstddef>
#include <map>
#include <string>
#include <vector>

#include "profile/profile.hpp"
#include "profile/stats.hpp"
#include "types/field_type.hpp"

namespace tabprof {

struct report_summary {
    std::size_t total_fields = 0;
    std::size_t total_missing = 0;
    std::map<std::string, std::size_t> type_counts;   // keyed by type name
    double completeness_percentage = 0.0;
};

inline report_summary summarize(const analysis_report& r) {
    report_summary s;
    s.total_fields = r.fields.size();
    for (const auto& f : r.fields) {
        s.total_missing += missing_count(f.stats);
        ++s.type_counts[to_string(f.type)];
    }
    s.completeness_percentage = r.completeness_percentage;
    return s;
}

// Column names per type name, each list in source column order.
inline std::map<std::string, std::vector<std::string>> group_by_type(const analysis_report& r) {
    std::map<std::string, std::vector<std::string>> groups;
    for (const auto& f : r.fields) groups[to_string(f.type)].push_back(f.name);
    return groups;
}

}

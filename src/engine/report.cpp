#include <depman/report.hpp>
#include <sstream>

namespace depman {

std::string describe_status(const DependencyStatus& st) {
    std::string version = st.current_version.empty() ? "unknown version"
                                                     : st.current_version;
    switch (st.state) {
        case DependencyState::Satisfied:
            return "satisfied (" + version + ")";
        case DependencyState::Installed:
            return "installed (" + version + ")";
        case DependencyState::NeedsInstall:
            if (!st.installed) return "not installed";
            if (st.error) return version + " installed, " + st.error->message;
            return version + " installed, " +
                   update_kind_name(st.required_update) + " needed";
        case DependencyState::Failed:
            return "failed: " + (st.error ? st.error->format() : std::string("unknown error"));
        case DependencyState::Cancelled:
            return "cancelled";
        case DependencyState::Pending:
        case DependencyState::Checking:
        case DependencyState::Installing:
            return state_name(st.state);
    }
    return state_name(st.state);
}

bool needs_attention(const DependencyStatus& st) {
    return st.state != DependencyState::Satisfied &&
           st.state != DependencyState::Installed;
}

std::string format_report(const RunReport& report) {
    std::ostringstream out;
    for (const auto& name : report.order) {
        auto it = report.statuses.find(name);
        if (it == report.statuses.end()) continue;
        out << "- " << name << ": " << describe_status(it->second) << "\n";
    }
    return out.str();
}

} // namespace depman

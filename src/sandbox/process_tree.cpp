#include <execbox/sandbox/process_tree.hpp>

#include <execbox/common/linux.hpp>
#include <execbox/logging.hpp>

#include <fmt/format.h>
#include <range/v3/algorithm/any_of.hpp>
#include <range/v3/range/conversion.hpp>
#include <range/v3/view/split.hpp>

#include <algorithm>
#include <charconv>
#include <chrono>
#include <csignal>
#include <cstdint>
#include <deque>
#include <filesystem>
#include <fstream>
#include <functional>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <system_error>
#include <thread>
#include <tuple>
#include <unordered_map>
#include <vector>

#include <sys/types.h>
#include <unistd.h>

namespace execbox {

namespace {

// Field numbers as documented in proc_pid_stat(5), 1-based
constexpr std::size_t STATE_FIELD = 3;
constexpr std::size_t PPID_FIELD = 4;
constexpr std::size_t PGRP_FIELD = 5;
constexpr std::size_t SESSION_FIELD = 6;
constexpr std::size_t START_TIME_FIELD = 22;
constexpr std::size_t RSS_FIELD = 24;

template <typename IntT>
std::optional<IntT> parse_int(std::string_view str) {
    IntT value{};
    auto [ptr, ec] = std::from_chars(str.data(), str.data() + str.size(), value);

    if (ec != std::errc{} || ptr != str.data() + str.size()) {
        return std::nullopt;
    }

    return value;
}

std::uint64_t page_size() {
    static const auto size = static_cast<std::uint64_t>(::sysconf(_SC_PAGESIZE));
    return size;
}

/// Every process in /proc
std::vector<ProcessStatus> list_all_processes() {
    std::vector<ProcessStatus> result;

    std::error_code err;
    std::filesystem::directory_iterator iter{"/proc", err};

    if (err) {
        LOG_WARN("Could not scan /proc: {}", err.message());
        return result;
    }

    for (const std::filesystem::directory_iterator end{}; iter != end; iter.increment(err)) {
        if (err) {
            LOG_DEBUG("Scan of /proc stopped early: {}", err.message());
            break;
        }

        auto pid = parse_int<pid_t>(iter->path().filename().native());
        if (!pid) {
            continue;
        }

        if (auto status = read_process_status(*pid)) {
            result.push_back(*status);
        }
    }

    return result;
}

bool any_alive(const std::vector<ProcessStatus>& members) {
    return ranges::any_of(members, [](const ProcessStatus& proc) { return !proc.is_zombie(); });
}

} // namespace

std::optional<ProcessStatus> parse_proc_stat(std::string_view contents, std::uint64_t page_size) {
    auto comm_end = contents.rfind(')');
    auto pid_end = contents.find(' ');

    if (comm_end == std::string_view::npos || pid_end == std::string_view::npos || pid_end > comm_end) {
        return std::nullopt;
    }

    auto pid = parse_int<pid_t>(contents.substr(0, pid_end));

    // Remaining fields start at field 3 (state)
    std::string_view rest = contents.substr(comm_end + 1);

    std::vector fields = rest | ranges::views::split(' ') | ranges::to<std::vector<std::string>>;

    // split on a leading space produces an empty first element
    std::erase_if(fields, [](const std::string& field) { return field.empty(); });

    auto field = [&fields](std::size_t field_num) -> std::optional<std::string_view> {
        std::size_t idx = field_num - STATE_FIELD;
        if (idx >= fields.size()) {
            return std::nullopt;
        }
        return fields[idx];
    };

    auto pid_field = [&field](std::size_t field_num) {
        return field(field_num).and_then([](std::string_view str) { return parse_int<pid_t>(str); });
    };

    auto state = field(STATE_FIELD);
    auto ppid = pid_field(PPID_FIELD);
    auto pgrp = pid_field(PGRP_FIELD);
    auto session = pid_field(SESSION_FIELD);
    auto start_time =
        field(START_TIME_FIELD).and_then([](std::string_view str) { return parse_int<std::uint64_t>(str); });
    auto rss_pages = field(RSS_FIELD).and_then([](std::string_view str) { return parse_int<std::int64_t>(str); });

    if (!pid || !state || state->size() != 1 || !ppid || !pgrp || !session || !start_time || !rss_pages) {
        return std::nullopt;
    }

    return ProcessStatus{.pid = *pid,
                         .state = state->front(),
                         .ppid = *ppid,
                         .pgrp = *pgrp,
                         .session = *session,
                         .start_time = *start_time,
                         .resident_bytes = static_cast<std::uint64_t>(std::max<std::int64_t>(*rss_pages, 0)) *
                                           page_size};
}

std::optional<ProcessStatus> read_process_status(pid_t pid) {
    // Processes come and go while we scan; failure to open is normal
    std::ifstream stat_file{fmt::format("/proc/{}/stat", pid)};

    if (!stat_file.is_open()) {
        return std::nullopt;
    }

    std::ostringstream contents;
    contents << stat_file.rdbuf();

    return parse_proc_stat(contents.str(), page_size());
}

std::vector<ProcessStatus> list_descendants(pid_t root) {
    std::unordered_map<pid_t, std::vector<ProcessStatus>> children;

    for (const ProcessStatus& proc : list_all_processes()) {
        children[proc.ppid].push_back(proc);
    }

    std::vector<ProcessStatus> result;
    std::deque<pid_t> pending{root};

    while (!pending.empty()) {
        pid_t parent = pending.front();
        pending.pop_front();

        auto iter = children.find(parent);
        if (iter == children.end()) {
            continue;
        }

        for (const ProcessStatus& child : iter->second) {
            result.push_back(child);
            pending.push_back(child.pid);
        }
    }

    return result;
}

void signal_all(const std::vector<ProcessStatus>& members, int sig) {
    for (const ProcessStatus& proc : members) {
        if (!proc.is_zombie()) {
            // ESRCH if it exited since the scan
            std::ignore = linux::kill(proc.pid, sig);
        }
    }
}

bool kill_until_gone(const std::function<std::vector<ProcessStatus>()>& list_members,
                     std::chrono::milliseconds patience) {
    using namespace std::chrono_literals;
    using std::chrono::steady_clock;

    const auto deadline = steady_clock::now() + patience;

    while (true) {
        std::vector<ProcessStatus> members = list_members();

        if (!any_alive(members)) {
            return true;
        }

        if (steady_clock::now() >= deadline) {
            LOG_WARN("{} process(es) still alive after SIGKILL", members.size());
            return false;
        }

        signal_all(members, SIGKILL);

        // SIGKILL is delivered asynchronously
        std::this_thread::sleep_for(1ms);
    }
}

bool kill_descendants(pid_t root, std::chrono::milliseconds patience) {
    return kill_until_gone([root] { return list_descendants(root); }, patience);
}

} // namespace execbox

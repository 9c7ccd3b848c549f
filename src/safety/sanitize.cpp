/*
 * ToolGate C++ - Input sanitizers
 */
#include <toolgate/safety/sanitize.hpp>
#include <toolgate/core/utils.hpp>
#include <toolgate/core/logger.hpp>

#include <vector>
#include <regex>
#include <algorithm>
#include <cctype>

namespace toolgate {

// ============================================================================
// Free text
// ============================================================================

std::string sanitize_text(const std::string& input, size_t max_len) {
    std::string out;
    out.reserve(input.size() < max_len ? input.size() : max_len);
    for (size_t i = 0; i < input.size(); ++i) {
        unsigned char c = static_cast<unsigned char>(input[i]);
        if (c == '\n' || c == '\t') {
            out.push_back(static_cast<char>(c));
            continue;
        }
        if (c < 0x20 || c == 0x7F) {
            continue;
        }
        out.push_back(static_cast<char>(c));
    }
    return truncate_safe(out, max_len);
}

// ============================================================================
// Node names
// ============================================================================

static const size_t MAX_NODE_NAME_LENGTH = 50;

NodeNameCheck sanitize_node_name(const std::string& name) {
    NodeNameCheck check;
    std::string trimmed = trim(name);
    if (trimmed.size() > MAX_NODE_NAME_LENGTH) {
        trimmed = trimmed.substr(0, MAX_NODE_NAME_LENGTH);
    }

    if (trimmed.empty()) {
        check.reason = "Node name cannot be empty";
        return check;
    }

    for (size_t i = 0; i < trimmed.size(); ++i) {
        unsigned char c = static_cast<unsigned char>(trimmed[i]);
        if (!isalnum(c) && c != '-' && c != '_') {
            check.reason = "Invalid node name \"" + trimmed +
                           "\": only letters, digits, hyphens and underscores are allowed";
            return check;
        }
    }

    check.safe = true;
    check.value = trimmed;
    return check;
}

// ============================================================================
// Shell commands
// ============================================================================

namespace {

// Always refused, matched as lowercase substrings. Applies under override.
const char* const COMMAND_DENYLIST[] = {
    "rm -rf /", "rm -fr /", "rm -rf /*", "rm -fr /*", "rm -rf ~", "rm -rf *",
    "mkfs", "dd if=", "fdisk", "parted", "wipefs", "shred /dev",
    "pvecm expected", "iptables -f", "iptables --flush", "ip link delete", "ip link del",
    "shutdown", "poweroff", "reboot", "init 0", "init 6", "halt", "systemctl kexec",
    ":(){", "chmod -r 777", "chown -r /", "mv /* ",
    "> /dev/sd", "> /dev/nvm", ">/dev/sd", ">/dev/nvm",
    "cat /dev/urandom >",
    "wget|sh", "curl|sh", "wget|bash", "curl|bash",
    "curl | sh", "curl | bash", "wget | sh", "wget | bash",
    "yes |", "nohup",
};

// Leading words a segment may start with. Matched on whole words.
const char* const COMMAND_ALLOWLIST[] = {
    // System info
    "hostname", "uptime", "uname", "date", "who", "w", "last", "id", "whoami",
    // Resources
    "df", "free", "top -bn1", "vmstat", "iostat", "nproc",
    // Processes
    "ps", "pgrep", "pidof",
    // Storage
    "du", "lsblk", "mount", "findmnt", "stat", "smartctl", "zpool", "zfs",
    "lvs", "vgs", "pvs", "blkid",
    // Files
    "cat", "head", "tail", "wc", "ls", "find", "file", "readlink", "realpath",
    "md5sum", "sha256sum", "diff", "cp", "mv", "mkdir", "touch", "tar", "gzip",
    "gunzip", "zip", "unzip", "rsync",
    // Text
    "grep", "awk", "sed", "sort", "uniq", "cut", "tr", "basename", "dirname",
    "echo", "printf",
    // Network
    "ip addr", "ip link show", "ip route", "ip neigh", "ss", "netstat", "ping",
    "traceroute", "nslookup", "dig", "curl", "wget", "ethtool", "arp",
    // Proxmox
    "pvesh", "pvecm status", "pvecm nodes", "pct", "qm", "pveam", "pvesm",
    // Services (read)
    "systemctl status", "systemctl is-active", "systemctl is-enabled",
    "systemctl list-units", "systemctl show", "journalctl", "timedatectl",
    "hostnamectl", "loginctl",
    // Hardware
    "sensors", "lscpu", "lsusb", "lspci", "lsmem", "dmesg",
    // Packages (read)
    "dpkg", "apt list", "apt show", "apt-cache", "apt-mark showhold",
    // Docker (read)
    "docker ps", "docker images", "docker logs", "docker inspect", "docker stats",
    "docker top", "docker volume ls", "docker network ls", "docker system df",
    "docker compose ps", "docker compose logs",
    // Misc
    "smbstatus", "testparm", "crontab -l", "git",
};

// Consulted only while an override is active.
const char* const OVERRIDE_ALLOWLIST[] = {
    "apt install", "apt-get install", "apt update", "apt-get update",
    "apt upgrade", "apt-get upgrade",
    "systemctl",
    "docker start", "docker stop", "docker restart", "docker exec", "docker compose",
    "kill", "pkill", "killall",
    "chmod", "chown",
    "npm", "pip", "pip3", "python3", "node",
    "rm",
};

// Whole-command patterns for which chaining is acceptable without override.
const char* const COMPOUND_ALLOWLIST[] = {
    "^cd [A-Za-z0-9_./~-]+ && (ls|pwd|git (status|log|diff))( [A-Za-z0-9_./~=-]+)*$",
    "^(uptime|hostname|date|whoami)( ?(;|&&) ?(uptime|hostname|date|whoami|free -h|df -h))+$",
    "^(systemctl (status|is-active)|docker ps)( [A-Za-z0-9_.@=-]+)* \\|\\| true$",
};

struct Segment {
    std::string text;
    bool chained;     // Preceded by ; && || & or newline
};

// Split on | ; && || & and newlines outside quotes.
std::vector<Segment> split_segments(const std::string& cmd) {
    std::vector<Segment> out;
    Segment current;
    current.chained = false;
    char quote = 0;

    for (size_t i = 0; i < cmd.size(); ++i) {
        char c = cmd[i];
        if (quote) {
            if (c == quote) quote = 0;
            current.text.push_back(c);
            continue;
        }
        if (c == '\'' || c == '"') {
            quote = c;
            current.text.push_back(c);
            continue;
        }

        bool split = false;
        bool chain = false;
        if (c == '|') {
            split = true;
            if (i + 1 < cmd.size() && cmd[i + 1] == '|') {
                chain = true;
                ++i;
            }
        } else if (c == '&') {
            // 2>&1 and &> are redirections, not background jobs
            bool redirect = (i > 0 && cmd[i - 1] == '>') || (i + 1 < cmd.size() && cmd[i + 1] == '>');
            if (redirect) {
                current.text.push_back(c);
                continue;
            }
            split = true;
            chain = true;
            if (i + 1 < cmd.size() && cmd[i + 1] == '&') ++i;
        } else if (c == ';' || c == '\n') {
            split = true;
            chain = true;
        }

        if (split) {
            out.push_back(current);
            current.text.clear();
            current.chained = chain;
        } else {
            current.text.push_back(c);
        }
    }
    out.push_back(current);
    return out;
}

std::vector<std::string> words_of(const std::string& s) {
    std::vector<std::string> words;
    std::string word;
    for (size_t i = 0; i < s.size(); ++i) {
        if (isspace(static_cast<unsigned char>(s[i]))) {
            if (!word.empty()) {
                words.push_back(word);
                word.clear();
            }
        } else {
            word.push_back(s[i]);
        }
    }
    if (!word.empty()) words.push_back(word);
    return words;
}

bool starts_with_words(const std::vector<std::string>& words, const std::string& entry) {
    std::vector<std::string> want = words_of(entry);
    if (want.empty() || words.size() < want.size()) return false;
    for (size_t i = 0; i < want.size(); ++i) {
        if (words[i] != want[i]) return false;
    }
    return true;
}

template <size_t N>
bool matches_list(const std::vector<std::string>& words, const char* const (&list)[N]) {
    for (size_t i = 0; i < N; ++i) {
        if (starts_with_words(words, list[i])) return true;
    }
    return false;
}

// rm under override: plain files at depth two or more, no globs, no recursion into /.
bool rm_targets_specific_paths(const std::vector<std::string>& words) {
    bool have_target = false;
    for (size_t i = 1; i < words.size(); ++i) {
        const std::string& w = words[i];
        if (w[0] == '-') continue;
        if (w[0] != '/' || w.find_first_of("*?[") != std::string::npos) return false;
        std::string norm = normalize_path(w);
        if (std::count(norm.begin(), norm.end(), '/') < 2) return false;
        have_target = true;
    }
    return have_target;
}

bool segment_allowed(const std::string& segment, bool override_active) {
    std::vector<std::string> words = words_of(segment);
    if (words.empty()) return false;
    if (matches_list(words, COMMAND_ALLOWLIST)) return true;
    if (!override_active) return false;
    if (!matches_list(words, OVERRIDE_ALLOWLIST)) return false;
    if (words[0] == "rm") return rm_targets_specific_paths(words);
    return true;
}

// Unquoted > or >> into anything but /dev/null. fd duplication (2>&1) is fine.
bool redirects_to_file(const std::string& segment) {
    char quote = 0;
    for (size_t i = 0; i < segment.size(); ++i) {
        char c = segment[i];
        if (quote) {
            if (c == quote) quote = 0;
            continue;
        }
        if (c == '\'' || c == '"') {
            quote = c;
            continue;
        }
        if (c != '>') continue;

        size_t j = i + 1;
        if (j < segment.size() && segment[j] == '>') ++j;
        if (j < segment.size() && segment[j] == '&') {
            i = j;
            continue;
        }
        while (j < segment.size() && isspace(static_cast<unsigned char>(segment[j]))) ++j;
        size_t end = j;
        while (end < segment.size() && !isspace(static_cast<unsigned char>(segment[end]))) ++end;
        if (segment.compare(j, end - j, "/dev/null") != 0) return true;
        i = end;
    }
    return false;
}

bool matches_compound_pattern(const std::string& cmd) {
    for (size_t i = 0; i < sizeof(COMPOUND_ALLOWLIST) / sizeof(COMPOUND_ALLOWLIST[0]); ++i) {
        try {
            if (std::regex_match(cmd, std::regex(COMPOUND_ALLOWLIST[i]))) return true;
        } catch (const std::regex_error& e) {
            LOG_ERROR("Bad compound pattern %zu: %s", i, e.what());
        }
    }
    return false;
}

std::string preview(const std::string& cmd) {
    if (cmd.size() <= 60) return cmd;
    return truncate_safe(cmd, 60) + "...";
}

} // anonymous namespace

CommandCheck sanitize_command(const std::string& command, bool override_active) {
    std::string trimmed = trim(command);
    if (trimmed.empty()) {
        return CommandCheck(false, "Empty command");
    }

    std::string lower = to_lower(trimmed);
    for (size_t i = 0; i < sizeof(COMMAND_DENYLIST) / sizeof(COMMAND_DENYLIST[0]); ++i) {
        if (lower.find(COMMAND_DENYLIST[i]) != std::string::npos) {
            return CommandCheck(false, std::string("Command contains blocked pattern: \"") +
                                           COMMAND_DENYLIST[i] + "\"");
        }
    }

    if (trimmed.find('`') != std::string::npos) {
        return CommandCheck(false, "Command contains backtick substitution");
    }
    if (trimmed.find("$(") != std::string::npos) {
        return CommandCheck(false, "Command contains $( ) substitution");
    }
    if (trimmed.find("<(") != std::string::npos || trimmed.find(">(") != std::string::npos) {
        return CommandCheck(false, "Command contains process substitution");
    }

    std::vector<Segment> segments = split_segments(trimmed);
    bool chained = false;
    for (size_t i = 0; i < segments.size(); ++i) {
        if (segments[i].chained) chained = true;
    }

    if (chained && matches_compound_pattern(trimmed)) {
        return CommandCheck(true, "");
    }
    if (chained && !override_active) {
        return CommandCheck(false, "Command chaining (; && || & newline) is not allowed: \"" +
                                       preview(trimmed) + "\"");
    }

    for (size_t i = 0; i < segments.size(); ++i) {
        std::string seg = trim(segments[i].text);
        if (seg.empty()) {
            return CommandCheck(false, "Command has an empty pipeline segment");
        }
        if (!override_active && redirects_to_file(seg)) {
            return CommandCheck(false, "Output redirection to a file requires override: \"" +
                                           preview(seg) + "\"");
        }
        if (!segment_allowed(seg, override_active)) {
            return CommandCheck(false, "Command \"" + preview(seg) + "\" is not in the allowlist");
        }
    }

    return CommandCheck(true, "");
}

} // namespace toolgate

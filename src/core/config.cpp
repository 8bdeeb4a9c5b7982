#include "fastbu/config.hpp"
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <set>
#include <cctype>

namespace fastbu {

// Minimal TOML reader for node configuration files.
// Supports [section] / [section.sub] headers, key = value with strings,
// integers, booleans and arrays of strings, and # comments.

namespace {

std::string trim(const std::string& s) {
    auto start = s.find_first_not_of(" \t\n\r");
    if (start == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t\n\r");
    return s.substr(start, end - start + 1);
}

// Drop a trailing comment that is not inside a quoted string
std::string strip_comment(const std::string& line) {
    bool in_string = false;
    for (size_t i = 0; i < line.size(); ++i) {
        char c = line[i];
        if (c == '"' && (i == 0 || line[i - 1] != '\\')) {
            in_string = !in_string;
        } else if (c == '#' && !in_string) {
            return line.substr(0, i);
        }
    }
    return line;
}

std::string unquote(const std::string& raw, size_t line_no) {
    if (raw.size() < 2 || raw.front() != '"' || raw.back() != '"') {
        throw std::runtime_error("Line " + std::to_string(line_no) +
                                 ": expected quoted string, got '" + raw + "'");
    }
    std::string out;
    out.reserve(raw.size() - 2);
    for (size_t i = 1; i + 1 < raw.size(); ++i) {
        if (raw[i] == '\\' && i + 2 < raw.size()) {
            char n = raw[++i];
            switch (n) {
                case 'n': out.push_back('\n'); break;
                case 't': out.push_back('\t'); break;
                default: out.push_back(n); break;
            }
        } else {
            out.push_back(raw[i]);
        }
    }
    return out;
}

class SimpleToml {
public:
    explicit SimpleToml(const std::string& text) {
        parse(text);
    }

    bool has(const std::string& section, const std::string& key) const {
        return values_.count(section + "." + key) > 0;
    }

    std::string get_string(const std::string& section, const std::string& key,
                           const std::string& def = "") const {
        auto it = values_.find(section + "." + key);
        if (it == values_.end()) return def;
        return unquote(it->second.text, it->second.line);
    }

    int64_t get_int(const std::string& section, const std::string& key,
                    int64_t def = 0) const {
        auto it = values_.find(section + "." + key);
        if (it == values_.end()) return def;
        const auto& v = it->second;
        size_t pos = 0;
        int64_t result = 0;
        try {
            result = std::stoll(v.text, &pos);
        } catch (const std::exception&) {
            pos = 0;
        }
        if (pos == 0 || pos != v.text.size()) {
            throw std::runtime_error("Line " + std::to_string(v.line) +
                                     ": expected integer for '" + key + "'");
        }
        return result;
    }

    bool get_bool(const std::string& section, const std::string& key, bool def = false) const {
        auto it = values_.find(section + "." + key);
        if (it == values_.end()) return def;
        if (it->second.text == "true") return true;
        if (it->second.text == "false") return false;
        throw std::runtime_error("Line " + std::to_string(it->second.line) +
                                 ": expected boolean for '" + key + "'");
    }

    std::vector<std::string> get_string_array(const std::string& section,
                                              const std::string& key) const {
        std::vector<std::string> result;
        auto it = values_.find(section + "." + key);
        if (it == values_.end()) return result;

        const auto& v = it->second;
        if (v.text.size() < 2 || v.text.front() != '[' || v.text.back() != ']') {
            throw std::runtime_error("Line " + std::to_string(v.line) +
                                     ": expected array for '" + key + "'");
        }

        std::string body = v.text.substr(1, v.text.size() - 2);
        size_t start = 0;
        while (start < body.size()) {
            auto comma = body.find(',', start);
            auto item = trim(body.substr(start, comma == std::string::npos
                                                    ? std::string::npos
                                                    : comma - start));
            if (!item.empty()) {
                result.push_back(unquote(item, v.line));
            }
            if (comma == std::string::npos) break;
            start = comma + 1;
        }
        return result;
    }

    // All key/value pairs of one section, strings unquoted
    std::map<std::string, std::string> section(const std::string& name) const {
        std::map<std::string, std::string> result;
        auto prefix = name + ".";
        for (const auto& [full, v] : values_) {
            if (full.compare(0, prefix.size(), prefix) != 0) continue;
            auto key = full.substr(prefix.size());
            if (key.find('.') != std::string::npos) continue;
            result[key] = (!v.text.empty() && v.text.front() == '"')
                              ? unquote(v.text, v.line)
                              : v.text;
        }
        return result;
    }

private:
    struct Value {
        std::string text;
        size_t line = 0;
    };
    std::map<std::string, Value> values_;

    void parse(const std::string& text) {
        std::istringstream in(text);
        std::string raw;
        std::string current;
        size_t line_no = 0;
        std::string pending_key;
        Value pending;

        while (std::getline(in, raw)) {
            ++line_no;
            auto line = trim(strip_comment(raw));
            if (line.empty()) continue;

            // Continuation of a multi-line array
            if (!pending_key.empty()) {
                pending.text += line;
                if (line.back() == ']') {
                    values_[pending_key] = pending;
                    pending_key.clear();
                }
                continue;
            }

            if (line.front() == '[') {
                if (line.back() != ']') {
                    throw std::runtime_error("Line " + std::to_string(line_no) +
                                             ": malformed section header");
                }
                current = trim(line.substr(1, line.size() - 2));
                continue;
            }

            auto eq = line.find('=');
            if (eq == std::string::npos) {
                throw std::runtime_error("Line " + std::to_string(line_no) +
                                         ": expected key = value");
            }

            auto key = trim(line.substr(0, eq));
            auto value = trim(line.substr(eq + 1));
            if (key.empty()) {
                throw std::runtime_error("Line " + std::to_string(line_no) + ": empty key");
            }
            if (key.size() >= 2 && key.front() == '"' && key.back() == '"') {
                key = unquote(key, line_no);
            }

            auto full = current + "." + key;
            if (!value.empty() && value.front() == '[' && value.back() != ']') {
                pending_key = full;
                pending = Value{value, line_no};
                continue;
            }
            values_[full] = Value{value, line_no};
        }

        if (!pending_key.empty()) {
            throw std::runtime_error("Line " + std::to_string(pending.line) +
                                     ": unterminated array");
        }
    }
};

std::string quote(const std::string& s) {
    std::string out = "\"";
    for (char c : s) {
        if (c == '"' || c == '\\') out.push_back('\\');
        out.push_back(c);
    }
    out.push_back('"');
    return out;
}

uint16_t to_port(int64_t v, const char* name) {
    if (v < 0 || v > 65535) {
        throw std::runtime_error(std::string("Port out of range: ") + name);
    }
    return static_cast<uint16_t>(v);
}

// Range-check before any unsigned conversion
int64_t in_range(int64_t v, int64_t lo, int64_t hi, const char* name) {
    if (v < lo || v > hi) {
        throw std::runtime_error(std::string(name) + " must be between " + std::to_string(lo)
                                 + " and " + std::to_string(hi) + ", got " + std::to_string(v));
    }
    return v;
}

constexpr int64_t MAX_SECONDS = 7 * 24 * 3600;

std::chrono::seconds to_seconds(int64_t v, int64_t lo, const char* name) {
    return std::chrono::seconds(in_range(v, lo, MAX_SECONDS, name));
}

}  // namespace

bool parse_host_port(const std::string& addr, std::string& host, uint16_t& port) {
    auto colon = addr.rfind(':');
    if (colon == std::string::npos || colon == 0 || colon + 1 >= addr.size()) {
        return false;
    }
    auto port_str = addr.substr(colon + 1);
    for (char c : port_str) {
        if (c < '0' || c > '9') return false;
    }
    if (port_str.size() > 5) return false;
    auto value = std::stoul(port_str);
    if (value == 0 || value > 65535) return false;

    host = addr.substr(0, colon);
    port = static_cast<uint16_t>(value);
    return true;
}

Config Config::load(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        throw std::runtime_error("Failed to open config file: " + path.string());
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return load_toml(buffer.str());
}

Config Config::load_toml(const std::string& text) {
    Config config;
    SimpleToml t(text);

    // Node
    config.node.id = t.get_string("node", "id", "");
    config.node.host = t.get_string("node", "host", config.node.host);
    config.node.bind_address = t.get_string("node", "bind_address", config.node.bind_address);
    config.node.port = to_port(t.get_int("node", "port", config.node.port), "node.port");
    config.node.api_port = to_port(t.get_int("node", "api_port", config.node.api_port),
                                   "node.api_port");
    config.node.metadata = t.section("node.metadata");

    // Cluster (durations are in seconds)
    config.cluster.seeds = t.get_string_array("cluster", "seeds");
    config.cluster.virtual_nodes = static_cast<size_t>(in_range(
        t.get_int("cluster", "virtual_nodes", 10), 1, static_cast<int64_t>(MAX_VIRTUAL_NODES),
        "cluster.virtual_nodes"));
    config.cluster.gossip_interval = to_seconds(
        t.get_int("cluster", "gossip_interval", 1), 1, "cluster.gossip_interval");
    config.cluster.node_timeout = to_seconds(
        t.get_int("cluster", "node_timeout", 10), 1, "cluster.node_timeout");
    config.cluster.suspect_timeout = t.has("cluster", "suspect_timeout")
        ? std::chrono::milliseconds(to_seconds(t.get_int("cluster", "suspect_timeout"), 1,
                                               "cluster.suspect_timeout"))
        : config.cluster.node_timeout;
    // 0 keeps dead entries forever
    config.cluster.dead_node_retention = to_seconds(
        t.get_int("cluster", "dead_node_retention", 0), 0, "cluster.dead_node_retention");
    config.cluster.request_timeout = to_seconds(
        t.get_int("cluster", "request_timeout", 5), 1, "cluster.request_timeout");
    config.cluster.probe_fanout = static_cast<size_t>(in_range(
        t.get_int("cluster", "probe_fanout", 3), 1, static_cast<int64_t>(MAX_PROBE_FANOUT),
        "cluster.probe_fanout"));

    // Storage
    auto storage_path = t.get_string("storage", "path", "");
    if (!storage_path.empty()) {
        config.storage.path = storage_path;
    }
    config.storage.index_file = t.get_string("storage", "index_file", config.storage.index_file);
    config.storage.sync_writes = t.get_bool("storage", "sync_writes", true);

    // HTTP
    config.http.max_request_size = static_cast<size_t>(in_range(
        t.get_int("http", "max_request_size", config.http.max_request_size),
        1, int64_t{1} << 32, "http.max_request_size"));
    config.http.keep_alive_timeout = to_seconds(
        t.get_int("http", "keep_alive_timeout", 30), 0, "http.keep_alive_timeout");

    // Performance
    config.perf.worker_threads = static_cast<size_t>(in_range(
        t.get_int("performance", "worker_threads", 0), 0, 1024, "performance.worker_threads"));

    // Log
    auto level = t.get_string("log", "level", "info");
    if (!Logger::parse_level(level, config.log_level)) {
        throw std::runtime_error("Unknown log level: " + level);
    }

    return config;
}

void Config::save(const std::filesystem::path& path) const {
    std::ofstream file(path);
    if (!file) {
        throw std::runtime_error("Failed to open config file for writing: " + path.string());
    }
    file << to_toml();
}

std::string Config::to_toml() const {
    using std::chrono::duration_cast;
    using std::chrono::seconds;

    std::ostringstream oss;

    oss << "[node]\n";
    oss << "id = " << quote(node.id) << "\n";
    oss << "host = " << quote(node.host) << "\n";
    oss << "bind_address = " << quote(node.bind_address) << "\n";
    oss << "port = " << node.port << "\n";
    oss << "api_port = " << node.api_port << "\n";

    if (!node.metadata.empty()) {
        oss << "\n[node.metadata]\n";
        for (const auto& [k, v] : node.metadata) {
            oss << quote(k) << " = " << quote(v) << "\n";
        }
    }

    oss << "\n[cluster]\n";
    oss << "seeds = [";
    for (size_t i = 0; i < cluster.seeds.size(); ++i) {
        if (i > 0) oss << ", ";
        oss << quote(cluster.seeds[i]);
    }
    oss << "]\n";
    oss << "virtual_nodes = " << cluster.virtual_nodes << "\n";
    oss << "gossip_interval = " << duration_cast<seconds>(cluster.gossip_interval).count() << "\n";
    oss << "node_timeout = " << duration_cast<seconds>(cluster.node_timeout).count() << "\n";
    oss << "suspect_timeout = " << duration_cast<seconds>(cluster.suspect_timeout).count() << "\n";
    oss << "dead_node_retention = "
        << duration_cast<seconds>(cluster.dead_node_retention).count() << "\n";
    oss << "request_timeout = " << duration_cast<seconds>(cluster.request_timeout).count() << "\n";
    oss << "probe_fanout = " << cluster.probe_fanout << "\n";

    oss << "\n[storage]\n";
    oss << "path = " << quote(storage.path.string()) << "\n";
    oss << "index_file = " << quote(storage.index_file) << "\n";
    oss << "sync_writes = " << (storage.sync_writes ? "true" : "false") << "\n";

    oss << "\n[http]\n";
    oss << "max_request_size = " << http.max_request_size << "\n";
    oss << "keep_alive_timeout = " << http.keep_alive_timeout.count() << "\n";

    oss << "\n[performance]\n";
    oss << "worker_threads = " << perf.worker_threads << "\n";

    std::string level = Logger::level_name(log_level);
    for (auto& c : level) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    oss << "\n[log]\n";
    oss << "level = " << quote(level) << "\n";

    return oss.str();
}

Status Config::validate() const {
    if (node.effective_id().empty()) {
        return Status::error(ErrorCode::InvalidArgument, "Node id must not be empty");
    }

    if (node.host.empty()) {
        return Status::error(ErrorCode::InvalidArgument, "Node host must not be empty");
    }

    if (node.port == 0 || node.api_port == 0) {
        return Status::error(ErrorCode::InvalidArgument, "Ports must be non-zero");
    }

    if (node.port == node.api_port) {
        return Status::error(ErrorCode::InvalidArgument,
                            "Cluster port and API port must differ");
    }

    if (cluster.virtual_nodes == 0 || cluster.virtual_nodes > MAX_VIRTUAL_NODES) {
        return Status::error(ErrorCode::InvalidArgument,
                            "virtual_nodes must be between 1 and "
                            + std::to_string(MAX_VIRTUAL_NODES));
    }

    if (cluster.gossip_interval.count() <= 0) {
        return Status::error(ErrorCode::InvalidArgument,
                            "gossip_interval must be positive");
    }

    if (cluster.node_timeout <= cluster.gossip_interval) {
        return Status::error(ErrorCode::InvalidArgument,
                            "node_timeout must be greater than gossip_interval");
    }

    if (cluster.suspect_timeout.count() <= 0 || cluster.request_timeout.count() <= 0) {
        return Status::error(ErrorCode::InvalidArgument,
                            "suspect_timeout and request_timeout must be positive");
    }

    if (cluster.probe_fanout == 0 || cluster.probe_fanout > MAX_PROBE_FANOUT) {
        return Status::error(ErrorCode::InvalidArgument,
                            "probe_fanout must be between 1 and "
                            + std::to_string(MAX_PROBE_FANOUT));
    }

    if (cluster.dead_node_retention.count() < 0) {
        return Status::error(ErrorCode::InvalidArgument,
                            "dead_node_retention must not be negative");
    }

    std::set<std::string> seen;
    for (const auto& seed : cluster.seeds) {
        std::string host;
        uint16_t port = 0;
        if (!parse_host_port(seed, host, port)) {
            return Status::error(ErrorCode::InvalidArgument,
                                "Seed must be host:port: " + seed);
        }
        if (!seen.insert(seed).second) {
            return Status::error(ErrorCode::InvalidArgument, "Duplicate seed: " + seed);
        }
    }

    if (storage.path.empty() || storage.index_file.empty()) {
        return Status::error(ErrorCode::InvalidArgument,
                            "Storage path and index file must be set");
    }

    return Status::make_ok();
}

}  // namespace fastbu

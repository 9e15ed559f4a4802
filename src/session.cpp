#include "session.hpp"

#include <nlohmann/json.hpp>

#include <ctime>
#include <fstream>
#include <sstream>

void SessionSnapshot::set(const std::string& key, SessionValue v)
{
    for (auto& e : entries) {
        if (e.first == key) {
            e.second = std::move(v);
            return;
        }
    }
    entries.emplace_back(key, std::move(v));
}

const SessionValue* SessionSnapshot::find(const std::string& key) const
{
    for (const auto& e : entries)
        if (e.first == key) return &e.second;
    return nullptr;
}

template<typename T>
static bool get_as(const SessionSnapshot& s, const std::string& key, T& out)
{
    const SessionValue* v = s.find(key);
    if (!v || !std::holds_alternative<T>(*v)) return false;
    out = std::get<T>(*v);
    return true;
}

bool SessionSnapshot::get(const std::string& key, double& out) const      { return get_as(*this, key, out); }
bool SessionSnapshot::get(const std::string& key, bool& out) const        { return get_as(*this, key, out); }
bool SessionSnapshot::get(const std::string& key, std::string& out) const { return get_as(*this, key, out); }

// ---------------------------------------------------------------------------
// JSON
// ---------------------------------------------------------------------------
std::string session_to_json(const SessionSnapshot& snap, int indent)
{
    nlohmann::ordered_json j = nlohmann::ordered_json::object();
    for (const auto& e : snap.entries) {
        std::visit([&](const auto& v) { j[e.first] = v; }, e.second);
    }
    return j.dump(indent);
}

std::string session_from_json(const std::string& text, SessionSnapshot& out)
{
    nlohmann::ordered_json j;
    try {
        j = nlohmann::ordered_json::parse(text);
    } catch (const nlohmann::json::parse_error& e) {
        return std::string("Invalid session JSON: ") + e.what();
    }
    if (!j.is_object())
        return "Invalid session JSON: top level is not an object";

    SessionSnapshot snap;
    for (auto it = j.begin(); it != j.end(); ++it) {
        const auto& v = it.value();
        if (v.is_boolean())
            snap.set(it.key(), v.get<bool>());
        else if (v.is_number())
            snap.set(it.key(), v.get<double>());
        else if (v.is_string())
            snap.set(it.key(), v.get<std::string>());
    }
    out = std::move(snap);
    return {};
}

// ---------------------------------------------------------------------------
// Files
// ---------------------------------------------------------------------------
std::string write_session_file(const std::string& path, const SessionSnapshot& snap)
{
    std::ofstream f(path, std::ios::binary | std::ios::trunc);
    if (!f) return "Cannot open file for writing: " + path;
    f << session_to_json(snap) << '\n';
    f.close();
    if (!f) return "Write failed: " + path;
    return {};
}

std::string read_session_file(const std::string& path, SessionSnapshot& out)
{
    std::ifstream f(path, std::ios::binary);
    if (!f) return "Cannot open file: " + path;
    std::ostringstream ss;
    ss << f.rdbuf();
    return session_from_json(ss.str(), out);
}

std::string utc_timestamp()
{
    const std::time_t now = std::time(nullptr);
    std::tm tm{};
#ifdef _WIN32
    gmtime_s(&tm, &now);
#else
    gmtime_r(&now, &tm);
#endif
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm);
    return buf;
}

std::string file_timestamp()
{
    const std::time_t now = std::time(nullptr);
    std::tm tm{};
#ifdef _WIN32
    localtime_s(&tm, &now);
#else
    localtime_r(&now, &tm);
#endif
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y%m%d_%H%M%S", &tm);
    return buf;
}

#include "RecordCodec.h"

#include <cerrno>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <sstream>
#include <utility>

namespace scout {

namespace {

bool isBlank(char c) { return c == ' ' || c == '\t'; }

void appendEscaped(std::string& out, char c) {
    switch (c) {
        case '\\': out += "\\\\"; break;
        case '\n': out += "\\n"; break;
        case '\r': out += "\\r"; break;
        case '\t': out += "\\t"; break;
        case ' ':  out += "\\s"; break;
        default:   out += '\\'; out += c; break;
    }
}

// Keys escape '=' and every blank so the first bare '=' always splits the line.
std::string escapeKey(const std::string& k) {
    std::string out;
    out.reserve(k.size());
    for (std::size_t i = 0; i < k.size(); ++i) {
        const char c = k[i];
        const bool leading_marker = (i == 0) && (c == '#' || c == '[');
        if (c == '\\' || c == '\n' || c == '\r' || c == '=' || isBlank(c) || leading_marker) {
            appendEscaped(out, c);
        } else {
            out += c;
        }
    }
    return out;
}

// Values are never trimmed on read; trailing blanks are escaped so editors
// that strip line ends cannot change them.
std::string escapeValue(const std::string& v) {
    std::size_t tail = v.size();
    while (tail > 0 && isBlank(v[tail - 1])) --tail;

    std::string out;
    out.reserve(v.size());
    for (std::size_t i = 0; i < v.size(); ++i) {
        const char c = v[i];
        if (c == '\\' || c == '\n' || c == '\r' || i >= tail) {
            appendEscaped(out, c);
        } else {
            out += c;
        }
    }
    return out;
}

std::string unescapeText(const std::string& v) {
    std::string out;
    out.reserve(v.size());
    for (std::size_t i = 0; i < v.size(); ++i) {
        if (v[i] == '\\' && i + 1 < v.size()) {
            const char n = v[++i];
            if (n == 'n') {
                out += '\n';
            } else if (n == 'r') {
                out += '\r';
            } else if (n == 't') {
                out += '\t';
            } else if (n == 's') {
                out += ' ';
            } else {
                out += n;
            }
        } else {
            out += v[i];
        }
    }
    return out;
}

// Position of the first '=' not preceded by an escape, or npos.
std::size_t findSeparator(const std::string& line, std::size_t from) {
    for (std::size_t i = from; i < line.size(); ++i) {
        if (line[i] == '\\') {
            ++i;
        } else if (line[i] == '=') {
            return i;
        }
    }
    return std::string::npos;
}

std::string trim(const std::string& s) {
    std::size_t b = 0;
    std::size_t e = s.size();
    while (b < e && (s[b] == ' ' || s[b] == '\t' || s[b] == '\r')) ++b;
    while (e > b && (s[e - 1] == ' ' || s[e - 1] == '\t' || s[e - 1] == '\r')) --e;
    return s.substr(b, e - b);
}

bool isLittleEndian() {
    const std::uint16_t probe = 1;
    std::uint8_t first = 0;
    std::memcpy(&first, &probe, 1);
    return first == 1;
}

template <typename T>
void appendLE(std::vector<std::uint8_t>& buf, T v) {
    std::uint8_t raw[sizeof(T)];
    std::memcpy(raw, &v, sizeof(T));
    if (!isLittleEndian()) {
        for (std::size_t i = 0; i < sizeof(T) / 2; ++i) std::swap(raw[i], raw[sizeof(T) - 1 - i]);
    }
    buf.insert(buf.end(), raw, raw + sizeof(T));
}

template <typename T>
T fromLE(const std::uint8_t* raw) {
    std::uint8_t tmp[sizeof(T)];
    std::memcpy(tmp, raw, sizeof(T));
    if (!isLittleEndian()) {
        for (std::size_t i = 0; i < sizeof(T) / 2; ++i) std::swap(tmp[i], tmp[sizeof(T) - 1 - i]);
    }
    T v;
    std::memcpy(&v, tmp, sizeof(T));
    return v;
}

// Strings longer than this are treated as a corrupt stream.
constexpr std::uint32_t kMaxWireString = 1u << 20;

} // namespace

// ---- AttributeSection ----

void AttributeSection::set(const std::string& key, const std::string& value) {
    values[key] = value;
}

void AttributeSection::setInt(const std::string& key, std::int64_t value) {
    values[key] = std::to_string(value);
}

void AttributeSection::setDouble(const std::string& key, double value) {
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%.17g", value);
    values[key] = buf;
}

void AttributeSection::setBool(const std::string& key, bool value) {
    values[key] = value ? "true" : "false";
}

bool AttributeSection::has(const std::string& key) const {
    return values.find(key) != values.end();
}

std::string AttributeSection::get(const std::string& key, const std::string& fallback) const {
    const auto it = values.find(key);
    return (it == values.end()) ? fallback : it->second;
}

std::int64_t AttributeSection::getInt(const std::string& key, std::int64_t fallback) const {
    const auto it = values.find(key);
    if (it == values.end() || it->second.empty()) return fallback;
    errno = 0;
    char* end = nullptr;
    const long long v = std::strtoll(it->second.c_str(), &end, 10);
    if (errno != 0 || end == it->second.c_str() || *end != '\0') return fallback;
    return static_cast<std::int64_t>(v);
}

double AttributeSection::getDouble(const std::string& key, double fallback) const {
    const auto it = values.find(key);
    if (it == values.end() || it->second.empty()) return fallback;
    char* end = nullptr;
    const double v = std::strtod(it->second.c_str(), &end);
    if (end == it->second.c_str() || *end != '\0' || !std::isfinite(v)) return fallback;
    return v;
}

bool AttributeSection::getBool(const std::string& key, bool fallback) const {
    const auto it = values.find(key);
    if (it == values.end()) return fallback;
    if (it->second == "true" || it->second == "1") return true;
    if (it->second == "false" || it->second == "0") return false;
    return fallback;
}

// ---- AttributeDocument ----

AttributeSection& AttributeDocument::addSection(const std::string& name) {
    sections_.push_back(AttributeSection{name, {}});
    return sections_.back();
}

std::vector<const AttributeSection*> AttributeDocument::sectionsNamed(const std::string& name) const {
    std::vector<const AttributeSection*> out;
    for (const auto& s : sections_) {
        if (s.name == name) out.push_back(&s);
    }
    return out;
}

std::string AttributeDocument::toText() const {
    std::ostringstream os;
    bool first = true;
    for (const auto& s : sections_) {
        if (!first) os << "\n";
        first = false;
        os << "[" << s.name << "]\n";
        for (const auto& kv : s.values) {
            os << escapeKey(kv.first) << "=" << escapeValue(kv.second) << "\n";
        }
    }
    return os.str();
}

bool AttributeDocument::parseText(const std::string& text, AttributeDocument& out, std::string* error) {
    out.clear();
    std::istringstream is(text);
    std::string raw;
    int line_no = 0;
    AttributeSection* current = nullptr;

    auto fail = [&](const char* what) {
        if (error) *error = "line " + std::to_string(line_no) + ": " + what;
        return false;
    };

    while (std::getline(is, raw)) {
        ++line_no;
        if (!raw.empty() && raw.back() == '\r') raw.pop_back();
        const std::string header = trim(raw);
        if (header.empty() || header[0] == '#') continue;

        if (header.front() == '[') {
            if (header.back() != ']' || header.size() < 3) return fail("malformed section header");
            current = &out.addSection(header.substr(1, header.size() - 2));
            continue;
        }

        // Only the key is trimmed; the value is taken verbatim.
        std::size_t begin = 0;
        while (begin < raw.size() && isBlank(raw[begin])) ++begin;
        const std::size_t eq = findSeparator(raw, begin);
        if (eq == std::string::npos) return fail("expected key=value");
        const std::string key = trim(raw.substr(begin, eq - begin));
        if (key.empty()) return fail("expected key=value");
        if (!current) return fail("attribute outside of a section");
        current->values[unescapeText(key)] = unescapeText(raw.substr(eq + 1));
    }
    return true;
}

bool AttributeDocument::saveFile(const std::string& path) const {
    std::ofstream f(path, std::ios::binary | std::ios::trunc);
    if (!f) return false;
    f << toText();
    return static_cast<bool>(f);
}

bool AttributeDocument::loadFile(const std::string& path, std::string* error) {
    std::ifstream f(path, std::ios::binary);
    if (!f) {
        if (error) *error = "cannot open " + path;
        return false;
    }
    std::ostringstream os;
    os << f.rdbuf();
    return parseText(os.str(), *this, error);
}

// ---- WireWriter ----

void WireWriter::writeU8(std::uint8_t v) { buf_.push_back(v); }
void WireWriter::writeU32(std::uint32_t v) { appendLE(buf_, v); }
void WireWriter::writeI32(std::int32_t v) { appendLE(buf_, v); }
void WireWriter::writeI64(std::int64_t v) { appendLE(buf_, v); }
void WireWriter::writeF64(double v) { appendLE(buf_, v); }

void WireWriter::writeString(const std::string& v) {
    writeU32(static_cast<std::uint32_t>(v.size()));
    buf_.insert(buf_.end(), v.begin(), v.end());
}

// ---- WireReader ----

bool WireReader::take(void* out, std::size_t n) {
    if (failed_ || pos_ > buf_.size() || buf_.size() - pos_ < n) {
        failed_ = true;
        std::memset(out, 0, n);
        return false;
    }
    std::memcpy(out, buf_.data() + pos_, n);
    pos_ += n;
    return true;
}

std::uint8_t WireReader::readU8() {
    std::uint8_t v = 0;
    take(&v, 1);
    return v;
}

std::uint32_t WireReader::readU32() {
    std::uint8_t raw[4];
    return take(raw, 4) ? fromLE<std::uint32_t>(raw) : 0u;
}

std::int32_t WireReader::readI32() {
    std::uint8_t raw[4];
    return take(raw, 4) ? fromLE<std::int32_t>(raw) : 0;
}

std::int64_t WireReader::readI64() {
    std::uint8_t raw[8];
    return take(raw, 8) ? fromLE<std::int64_t>(raw) : 0;
}

double WireReader::readF64() {
    std::uint8_t raw[8];
    return take(raw, 8) ? fromLE<double>(raw) : 0.0;
}

std::string WireReader::readString() {
    const std::uint32_t n = readU32();
    if (failed_ || n > kMaxWireString || buf_.size() - pos_ < n) {
        failed_ = true;
        return std::string();
    }
    std::string s(reinterpret_cast<const char*>(buf_.data() + pos_), n);
    pos_ += n;
    return s;
}

} // namespace scout

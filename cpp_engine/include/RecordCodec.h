#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace scout {

// One persisted entry: a named section of flat key/value attributes.
struct AttributeSection {
    std::string name;
    std::map<std::string, std::string> values;

    void set(const std::string& key, const std::string& value);
    void setInt(const std::string& key, std::int64_t value);
    void setDouble(const std::string& key, double value);
    void setBool(const std::string& key, bool value);

    bool has(const std::string& key) const;
    // Missing or unparsable values yield the fallback.
    std::string get(const std::string& key, const std::string& fallback = std::string()) const;
    std::int64_t getInt(const std::string& key, std::int64_t fallback) const;
    double getDouble(const std::string& key, double fallback) const;
    bool getBool(const std::string& key, bool fallback) const;
};

// Ordered list of sections with a line-oriented text form:
//   [section]
//   key=value
class AttributeDocument {
public:
    AttributeSection& addSection(const std::string& name);
    std::vector<const AttributeSection*> sectionsNamed(const std::string& name) const;
    const std::vector<AttributeSection>& sections() const { return sections_; }
    void clear() { sections_.clear(); }

    std::string toText() const;
    // false on malformed lines; error gets "line N: ..." when non-null.
    static bool parseText(const std::string& text, AttributeDocument& out, std::string* error);

    bool saveFile(const std::string& path) const;
    bool loadFile(const std::string& path, std::string* error);

private:
    std::vector<AttributeSection> sections_;
};

struct LoadReport {
    int loaded = 0;
    int skipped = 0; // corrupt entries
    int retired = 0; // valid entries dropped because a dependency was skipped
};

// Little-endian replication stream. The reader never throws; running past
// the end marks it failed and yields zero values.
class WireWriter {
public:
    void writeU8(std::uint8_t v);
    void writeBool(bool v) { writeU8(v ? 1u : 0u); }
    void writeU32(std::uint32_t v);
    void writeI32(std::int32_t v);
    void writeI64(std::int64_t v);
    void writeF64(double v);
    void writeString(const std::string& v);

    const std::vector<std::uint8_t>& bytes() const { return buf_; }

private:
    std::vector<std::uint8_t> buf_;
};

class WireReader {
public:
    explicit WireReader(const std::vector<std::uint8_t>& bytes) : buf_(bytes) {}

    std::uint8_t readU8();
    bool readBool() { return readU8() != 0u; }
    std::uint32_t readU32();
    std::int32_t readI32();
    std::int64_t readI64();
    double readF64();
    std::string readString();

    bool failed() const { return failed_; }
    bool atEnd() const { return pos_ >= buf_.size(); }

private:
    bool take(void* out, std::size_t n);

    const std::vector<std::uint8_t>& buf_;
    std::size_t pos_ = 0;
    bool failed_ = false;
};

} // namespace scout

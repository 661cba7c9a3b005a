#pragma once

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <map>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace google::protobuf {
class Value;
}

namespace flowlog::model {

/*
  Schema-free structured value used for record payloads, record metadata,
  lineage metadata and snapshot metadata.

  Tagged union of null / bool / int / double / string / array / object.
  Persisted as JSON text (postgres: jsonb-compatible, sqlite: text).

  Numbers round-trip through google::protobuf::Value, which stores doubles:
  integers are exact up to 2^53.
*/
class Document {
 public:
  using Array  = std::vector<Document>;
  using Object = std::map<std::string, Document>;

  enum class Kind : std::uint8_t {
    kNull = 0,
    kBool,
    kInt,
    kDouble,
    kString,
    kArray,
    kObject,
  };

  Document() = default;
  Document(std::nullptr_t) {
  }
  Document(bool v) : value_(v) {
  }
  Document(int v) : value_(static_cast<std::int64_t>(v)) {
  }
  Document(std::int64_t v) : value_(v) {
  }
  Document(double v) : value_(v) {
  }
  Document(const char* v) : value_(std::string(v)) {
  }
  Document(std::string v) : value_(std::move(v)) {
  }
  Document(Array v) : value_(std::move(v)) {
  }
  Document(Object v) : value_(std::move(v)) {
  }

  static Document MakeObject(std::initializer_list<std::pair<const std::string, Document>> fields = {});
  static Document MakeArray(std::initializer_list<Document> items = {});

  Kind kind() const;

  bool IsNull() const {
    return kind() == Kind::kNull;
  }
  bool IsNumber() const {
    return kind() == Kind::kInt || kind() == Kind::kDouble;
  }
  bool IsString() const {
    return kind() == Kind::kString;
  }
  bool IsArray() const {
    return kind() == Kind::kArray;
  }
  bool IsObject() const {
    return kind() == Kind::kObject;
  }

  // Typed accessors throw util::InvalidArgument on kind mismatch.
  bool               AsBool() const;
  std::int64_t       AsInt() const;
  double             AsDouble() const;
  const std::string& AsString() const;
  const Array&       AsArray() const;
  const Object&      AsObject() const;

  Array&  MutableArray();
  Object& MutableObject();

  // Object helpers. Find returns nullptr when absent or not an object.
  const Document* Find(std::string_view key) const;
  bool            Contains(std::string_view key) const;

  // Converts a null document into an object on first use.
  Document& operator[](const std::string& key);

  // Converts a null document into an array on first use.
  void PushBack(Document item);

  // Element count for arrays and objects, 0 otherwise.
  std::size_t size() const;

  // Numbers compare by value across int/double.
  bool operator==(const Document& other) const;
  bool operator!=(const Document& other) const {
    return !(*this == other);
  }

 private:
  std::variant<std::monostate, bool, std::int64_t, double, std::string, Array, Object> value_;
};

// Throws util::InvalidArgument if doc holds a number some backend cannot
// store exactly: NaN, +-Inf, or an integer beyond +-2^53. `what` prefixes
// the message.
void CheckPersistable(const Document& doc, std::string_view what);

// JSON text. ToJson of a null document is "null".
std::string ToJson(const Document& doc);

// Parses JSON text; an empty string yields null. Throws util::InvalidArgument.
Document FromJson(std::string_view json);

google::protobuf::Value ToProto(const Document& doc);
Document                FromProto(const google::protobuf::Value& value);

} // namespace flowlog::model

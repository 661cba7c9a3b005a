#include "internal/model/document.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>

#include <cmath>
#include <string>

#include "internal/util/errors.hpp"

namespace flowlog::model {

namespace {

constexpr double kMaxExactInteger = 9007199254740992.0; // 2^53

const char* KindName(Document::Kind kind) {
  switch (kind) {
    case Document::Kind::kNull:
      return "null";
    case Document::Kind::kBool:
      return "bool";
    case Document::Kind::kInt:
      return "int";
    case Document::Kind::kDouble:
      return "double";
    case Document::Kind::kString:
      return "string";
    case Document::Kind::kArray:
      return "array";
    case Document::Kind::kObject:
      return "object";
  }
  return "unknown";
}

[[noreturn]] void ThrowKindMismatch(Document::Kind expected, Document::Kind actual) {
  throw util::InvalidArgument(std::string("document is ") + KindName(actual) + ", expected " + KindName(expected));
}

} // namespace

Document Document::MakeObject(std::initializer_list<std::pair<const std::string, Document>> fields) {
  return Document(Object(fields));
}

Document Document::MakeArray(std::initializer_list<Document> items) {
  return Document(Array(items));
}

Document::Kind Document::kind() const {
  return static_cast<Kind>(value_.index());
}

bool Document::AsBool() const {
  if (const auto* v = std::get_if<bool>(&value_)) return *v;
  ThrowKindMismatch(Kind::kBool, kind());
}

std::int64_t Document::AsInt() const {
  if (const auto* v = std::get_if<std::int64_t>(&value_)) return *v;
  if (const auto* d = std::get_if<double>(&value_)) {
    if (std::trunc(*d) == *d && std::fabs(*d) <= kMaxExactInteger) return static_cast<std::int64_t>(*d);
  }
  ThrowKindMismatch(Kind::kInt, kind());
}

double Document::AsDouble() const {
  if (const auto* d = std::get_if<double>(&value_)) return *d;
  if (const auto* v = std::get_if<std::int64_t>(&value_)) return static_cast<double>(*v);
  ThrowKindMismatch(Kind::kDouble, kind());
}

const std::string& Document::AsString() const {
  if (const auto* v = std::get_if<std::string>(&value_)) return *v;
  ThrowKindMismatch(Kind::kString, kind());
}

const Document::Array& Document::AsArray() const {
  if (const auto* v = std::get_if<Array>(&value_)) return *v;
  ThrowKindMismatch(Kind::kArray, kind());
}

const Document::Object& Document::AsObject() const {
  if (const auto* v = std::get_if<Object>(&value_)) return *v;
  ThrowKindMismatch(Kind::kObject, kind());
}

Document::Array& Document::MutableArray() {
  if (IsNull()) value_ = Array{};
  if (auto* v = std::get_if<Array>(&value_)) return *v;
  ThrowKindMismatch(Kind::kArray, kind());
}

Document::Object& Document::MutableObject() {
  if (IsNull()) value_ = Object{};
  if (auto* v = std::get_if<Object>(&value_)) return *v;
  ThrowKindMismatch(Kind::kObject, kind());
}

const Document* Document::Find(std::string_view key) const {
  const auto* object = std::get_if<Object>(&value_);
  if (!object) return nullptr;

  auto it = object->find(std::string(key));
  if (it == object->end()) return nullptr;
  return &it->second;
}

bool Document::Contains(std::string_view key) const {
  return Find(key) != nullptr;
}

Document& Document::operator[](const std::string& key) {
  return MutableObject()[key];
}

void Document::PushBack(Document item) {
  MutableArray().push_back(std::move(item));
}

std::size_t Document::size() const {
  if (const auto* a = std::get_if<Array>(&value_)) return a->size();
  if (const auto* o = std::get_if<Object>(&value_)) return o->size();
  return 0;
}

bool Document::operator==(const Document& other) const {
  if (IsNumber() && other.IsNumber()) {
    if (kind() == Kind::kInt && other.kind() == Kind::kInt) return AsInt() == other.AsInt();
    return AsDouble() == other.AsDouble();
  }
  return value_ == other.value_;
}

void CheckPersistable(const Document& doc, std::string_view what) {
  switch (doc.kind()) {
    case Document::Kind::kInt: {
      const auto v = doc.AsInt();
      if (v > static_cast<std::int64_t>(kMaxExactInteger) || v < -static_cast<std::int64_t>(kMaxExactInteger)) {
        throw util::InvalidArgument(std::string(what) + ": integer " + std::to_string(v) + " exceeds 2^53");
      }
      break;
    }
    case Document::Kind::kDouble:
      if (!std::isfinite(doc.AsDouble())) {
        throw util::InvalidArgument(std::string(what) + ": non-finite number");
      }
      break;
    case Document::Kind::kArray:
      for (const auto& item : doc.AsArray()) {
        CheckPersistable(item, what);
      }
      break;
    case Document::Kind::kObject:
      for (const auto& [_, item] : doc.AsObject()) {
        CheckPersistable(item, what);
      }
      break;
    default:
      break;
  }
}

// ------------------------------------------------------------
// protobuf / JSON conversion
// ------------------------------------------------------------

google::protobuf::Value ToProto(const Document& doc) {
  google::protobuf::Value value;

  switch (doc.kind()) {
    case Document::Kind::kNull:
      value.set_null_value(google::protobuf::NullValue::NULL_VALUE);
      break;
    case Document::Kind::kBool:
      value.set_bool_value(doc.AsBool());
      break;
    case Document::Kind::kInt:
    case Document::Kind::kDouble:
      value.set_number_value(doc.AsDouble());
      break;
    case Document::Kind::kString:
      value.set_string_value(doc.AsString());
      break;
    case Document::Kind::kArray: {
      auto* list = value.mutable_list_value();
      for (const auto& item : doc.AsArray()) {
        *list->add_values() = ToProto(item);
      }
      break;
    }
    case Document::Kind::kObject: {
      auto* fields = value.mutable_struct_value()->mutable_fields();
      for (const auto& [key, item] : doc.AsObject()) {
        (*fields)[key] = ToProto(item);
      }
      break;
    }
  }

  return value;
}

Document FromProto(const google::protobuf::Value& value) {
  switch (value.kind_case()) {
    case google::protobuf::Value::kNullValue:
    case google::protobuf::Value::KIND_NOT_SET:
      return Document();
    case google::protobuf::Value::kBoolValue:
      return Document(value.bool_value());
    case google::protobuf::Value::kNumberValue: {
      const double n = value.number_value();
      if (std::trunc(n) == n && std::fabs(n) <= kMaxExactInteger) {
        return Document(static_cast<std::int64_t>(n));
      }
      return Document(n);
    }
    case google::protobuf::Value::kStringValue:
      return Document(value.string_value());
    case google::protobuf::Value::kListValue: {
      Document::Array items;
      items.reserve(static_cast<std::size_t>(value.list_value().values_size()));
      for (const auto& item : value.list_value().values()) {
        items.push_back(FromProto(item));
      }
      return Document(std::move(items));
    }
    case google::protobuf::Value::kStructValue: {
      Document::Object fields;
      for (const auto& [key, item] : value.struct_value().fields()) {
        fields.emplace(key, FromProto(item));
      }
      return Document(std::move(fields));
    }
  }
  return Document();
}

std::string ToJson(const Document& doc) {
  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(ToProto(doc), &json);
  if (!status.ok()) {
    throw util::InvalidArgument("document is not representable as JSON: " + std::string(status.message()));
  }
  return json;
}

Document FromJson(std::string_view json) {
  if (json.empty()) {
    return Document();
  }

  google::protobuf::Value value;
  auto status = google::protobuf::util::JsonStringToMessage(std::string(json), &value);
  if (!status.ok()) {
    throw util::InvalidArgument("invalid JSON document: " + std::string(status.message()));
  }
  return FromProto(value);
}

} // namespace flowlog::model

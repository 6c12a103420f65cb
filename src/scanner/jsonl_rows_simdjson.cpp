#include "arffkit/jsonl_rows_simdjson.hpp"
#include "arffkit/parse_policy.hpp"
#include "arffkit/schema.hpp"

#include <simdjson.h>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

namespace ak {

struct JsonlRowReader::Impl {
  const Schema& schema;
  JsonlConfig cfg;
  simdjson::ondemand::parser parser;
  std::string scratch;

  Impl(const Schema& s, JsonlConfig c) : schema(s), cfg(std::move(c)) {}
};

JsonlRowReader::JsonlRowReader(const Schema& schema, JsonlConfig cfg)
  : p_(new Impl(schema, std::move(cfg))) {}

JsonlRowReader::~JsonlRowReader() { delete p_; }

// JSON scalar -> untyped cell. Returns false for arrays/objects in strict mode.
static bool json_to_cell(simdjson::ondemand::value v, bool strict, Cell& out) {
  switch (v.type()) {
    case simdjson::ondemand::json_type::number: {
      simdjson::ondemand::number n = v.get_number();
      if (n.is_int64()) out = Cell(std::in_place_type<std::int64_t>, n.get_int64());
      else out = Cell(std::in_place_type<double>, n.as_double());
      return true;
    }
    case simdjson::ondemand::json_type::string: {
      std::string_view s = v.get_string();
      out = Cell(std::in_place_type<std::string>, s);
      return true;
    }
    case simdjson::ondemand::json_type::boolean:
      out = Cell(std::in_place_type<std::string>, bool(v.get_bool()) ? "true" : "false");
      return true;
    case simdjson::ondemand::json_type::null:
      out = Cell(Missing{});
      return true;
    default: {
      if (strict) return false;
      std::string_view tok = v.raw_json();
      out = Cell(std::in_place_type<std::string>, trim(tok));
      return true;
    }
  }
}

std::optional<NamedRow> JsonlRowReader::parse_line(std::string_view line) {
  err_.clear();

  // padded copy of the line; simdjson reads past the end
  auto& scratch = p_->scratch;
  scratch.assign(line.data(), line.size());
  scratch.resize(line.size() + simdjson::SIMDJSON_PADDING, '\0');
  simdjson::padded_string_view view(scratch.data(), line.size(), scratch.size());

  try {
    auto doc = p_->parser.iterate(view);
    const simdjson::ondemand::json_type t = doc.type();
    if (t != simdjson::ondemand::json_type::object) {
      err_ = "JSONL line is not an object";
      return std::nullopt;
    }

    NamedRow row;
    simdjson::ondemand::object obj = doc.get_object();
    for (auto field : obj) {
      std::string key(std::string_view(field.unescaped_key()));
      Cell cell;
      if (!json_to_cell(field.value(), p_->cfg.strict, cell)) {
        err_ = "nested value for key '" + key + "' (strict mode)";
        return std::nullopt;
      }

      const bool cls = !p_->cfg.class_key.empty() && key == p_->cfg.class_key;
      std::optional<Value> v;
      if (const AttributeSpec* spec = p_->schema.find(key)) {
        v = make_value(spec->kind, cell, cls, &err_);
        if (!v) {
          err_ = "key '" + key + "': " + err_;
          return std::nullopt;
        }
      } else {
        v = wrap_value(cell);
        if (!v) {
          err_ = "cannot infer a type for key '" + key + "'";
          return std::nullopt;
        }
        *v = v->with_class(cls);
      }
      row.set(std::move(key), std::move(*v));
    }
    return row;
  } catch (const std::exception& e) {
    err_ = e.what();
    return std::nullopt;
  }
}

}

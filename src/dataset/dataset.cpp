#include "arffkit/dataset.hpp"
#include "arffkit/chunk_reader.hpp"
#include "arffkit/parse_policy.hpp"
#include "arffkit/path_utils.hpp"
#include "arffkit/stream_sink.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <utility>

namespace ak {

Dataset::Dataset() = default;

Dataset::Dataset(std::string relation, std::vector<AttributeSpec> attrs)
  : schema_(std::move(relation)) {
  // Duplicate names are skipped and reported through error().
  for (auto& a : attrs) {
    a.name = std::string(strip_quotes(a.name));
    if (!schema_.define_attribute(std::move(a), &err_)) continue;
  }
}

Dataset::~Dataset() = default;
Dataset::Dataset(Dataset&&) noexcept = default;
Dataset& Dataset::operator=(Dataset&&) noexcept = default;

bool Dataset::fail(std::string msg) const {
  err_ = std::move(msg);
  return false;
}

std::vector<std::string> Dataset::attribute_names() const {
  std::vector<std::string> out;
  out.reserve(schema_.size());
  for (const auto& a : schema_.attributes()) out.push_back(a.name);
  return out;
}

void Dataset::realign(const std::vector<std::string>& before) {
  if (before == attribute_names()) return;
  std::vector<std::optional<std::size_t>> from;
  from.reserve(schema_.size());
  for (const auto& a : schema_.attributes()) {
    auto it = std::find(before.begin(), before.end(), a.name);
    if (it == before.end()) from.emplace_back(std::nullopt);
    else from.emplace_back(static_cast<std::size_t>(it - before.begin()));
  }
  for (auto& r : rows_) {
    auto* d = std::get_if<DenseRow>(&r);
    if (!d) continue;
    DenseRow n;
    n.reserve(from.size());
    for (const auto& idx : from) {
      if (idx && *idx < d->size()) n.push_back(std::move((*d)[*idx]));
      else n.emplace_back(Missing{});
    }
    *d = std::move(n);
  }
}

bool Dataset::frozen(std::string_view what) {
  if (!streaming()) return false;
  fail("cannot " + std::string(what) + " while streaming: the header has already been written");
  return true;
}

std::optional<Dataset> Dataset::parse(std::string_view text, ParserConfig cfg, std::string* err) {
  Dataset ds;
  ArffFsm fsm(ds, std::move(cfg));
  std::size_t start = 0;
  while (start < text.size()) {
    std::size_t pos = text.find('\n', start);
    std::string_view line = pos == std::string_view::npos ? text.substr(start)
                                                          : text.substr(start, pos - start);
    if (!fsm.feed(line)) {
      if (err) *err = fsm.error();
      return std::nullopt;
    }
    if (fsm.done() || pos == std::string_view::npos) break;
    start = pos + 1;
  }
  fsm.finish();
  return std::optional<Dataset>(std::move(ds));
}

std::optional<Dataset> Dataset::load(const std::string& path, ParserConfig cfg, std::string* err) {
  const bool schema_only = cfg.schema_only;
  Dataset ds;
  ArffFsm fsm(ds, std::move(cfg));
  ChunkReader reader(path);
  bool ok = true;
  const bool read_ok = reader.for_each_line([&](std::string_view line) {
    if (!fsm.feed(line)) { ok = false; return false; }
    return !fsm.done();
  });
  if (!read_ok) {
    if (err) *err = reader.error();
    return std::nullopt;
  }
  if (!ok) {
    if (err) *err = path + ": " + fsm.error();
    return std::nullopt;
  }
  fsm.finish();
  if (!schema_only) ds.source_path_ = path;
  return std::optional<Dataset>(std::move(ds));
}

Dataset Dataset::copy(bool schema_only) const {
  Dataset o;
  o.schema_ = schema_;
  if (schema_only) o.schema_.set_comment({});
  else o.rows_ = rows_;
  return o;
}

void Dataset::clear() {
  if (sink_) (void)sink_->close();
  sink_.reset();
  schema_ = Schema();
  rows_.clear();
  source_path_.clear();
  err_.clear();
}

bool Dataset::set_relation(std::string relation) {
  if (frozen("rename the relation")) return false;
  schema_.set_relation(std::move(relation));
  return true;
}

bool Dataset::set_comment(std::vector<std::string> lines) {
  if (frozen("change the comment")) return false;
  schema_.set_comment(std::move(lines));
  return true;
}

bool Dataset::define_attribute(AttributeSpec spec) {
  if (frozen("define attribute " + spec.name)) return false;
  const auto before = attribute_names();
  if (!schema_.define_attribute(std::move(spec), &err_)) return false;
  schema_.move_class_last();
  realign(before);
  return true;
}

bool Dataset::set_class(std::string_view name) {
  if (frozen("change the class attribute")) return false;
  const auto before = attribute_names();
  if (!schema_.set_class(name, &err_)) return false;
  realign(before);
  return true;
}

bool Dataset::set_nominal_values(std::string_view name, const std::vector<std::string>& values) {
  if (frozen("extend nominal values")) return false;
  return schema_.set_nominal_values(name, values, &err_);
}

bool Dataset::alphabetize_attributes() {
  if (frozen("reorder attributes")) return false;
  const auto before = attribute_names();
  schema_.alphabetize();
  realign(before);
  return true;
}

bool Dataset::append(Row row, const AppendOptions& opt) {
  err_.clear();

  if (auto* dense = std::get_if<DenseRow>(&row)) {
    auto typed = coerce_dense_row(schema_, *dense, &err_);
    if (!typed) return false;
    if (opt.schema_only) return true;
    return store_parsed(std::move(*typed));
  }

  NamedRow& named = std::get<NamedRow>(row);
  if (opt.update_schema) {
    const auto before = attribute_names();
    const bool ok = reconcile(named);
    realign(before);
    if (!ok) return false;
  }

  if (opt.schema_only) return true;
  return store_parsed(std::move(row));
}

bool Dataset::reconcile(NamedRow& named) {
  bool schema_change = false;
  const std::vector<NamedRow::Entry> entries(named.begin(), named.end());
  for (const auto& [name, v] : entries) {
    const AttributeSpec* spec = schema_.find(name);
    if (spec && !v.is_missing() && spec->kind != v.kind()) {
      return fail("Attempting to set attribute " + name + " to type " +
                  std::string(kind_name(v.kind())) + " but it is already defined as type " +
                  std::string(kind_name(spec->kind)) + ".");
    }

    if (!spec) {
      if (streaming()) { named.erase(name); continue; }
      AttributeSpec added;
      added.name = name;
      added.kind = v.kind();
      if (!schema_.define_attribute(std::move(added), &err_)) return false;
      spec = schema_.find(name);
      schema_change = true;
    }

    if (v.kind() == Kind::Nominal && !v.is_missing()) {
      const std::string text = v.text();
      if (streaming()) {
        if (!spec->allows(text)) { named.erase(name); continue; }
      } else if (schema_.add_nominal_value(name, text)) {
        schema_change = true;
      }
    }

    if (v.cls()) {
      // a streamed header cannot be reordered, so reject before designating
      if (streaming() && !schema_.class_attribute()) {
        const auto idx = schema_.index_of(name);
        if (idx && *idx + 1 != schema_.size())
          return fail("class attribute '" + name + "' is not last in the header that was already streamed");
      }
      if (!schema_.designate_class(name, &err_)) return false;
    }

    // the class attribute is assumed to be last by ARFF consumers
    if (!schema_.class_is_last()) {
      if (streaming()) {
        return fail("class attribute '" + *schema_.class_attribute() +
                    "' is not last in the header that was already streamed");
      }
      schema_.move_class_last();
    }
  }

  if (schema_change && streaming())
    return fail("Attempting to add data that doesn't match the schema while streaming.");
  return true;
}

bool Dataset::store_parsed(Row row) {
  if (streaming()) return emit(row);
  rows_.push_back(std::move(row));
  return true;
}

bool Dataset::emit(const Row& row) {
  ArffWriter w(schema_);
  std::optional<std::string> line;
  if (!w.write_line(row, Format::Sparse, line)) return fail(w.error());
  if (line && !sink_->write_line(*line)) return fail(sink_->error());
  if (!sink_->flush()) return fail(sink_->error());
  return true;
}

bool Dataset::open_stream(std::optional<std::string> class_attr, std::string path) {
  err_.clear();
  if (streaming()) return fail("stream already open: " + sink_->path());
  const Schema saved = schema_;
  const auto before = attribute_names();
  if (class_attr) {
    const bool ok = schema_.find(*class_attr) ? schema_.set_class(*class_attr, &err_)
                                               : schema_.designate_class(*class_attr, &err_);
    if (!ok) { schema_ = saved; return false; }
    realign(before);
  }
  const auto restore = [&](std::string msg) {
    const auto moved = attribute_names();
    schema_ = saved;
    realign(moved);
    return fail(std::move(msg));
  };

  // Render the header and every buffered row before the file is touched, so a
  // row that cannot be written leaves the dataset as it was.
  ArffWriter w(schema_);
  std::string text = w.write_header();
  text += "@data\n";
  for (const auto& r : rows_) {
    std::optional<std::string> line;
    if (!w.write_line(r, Format::Sparse, line)) return restore(w.error());
    if (line) { text += *line; text += '\n'; }
  }

  auto sink = std::make_unique<StreamSink>();
  if (!sink->open(std::move(path))) return restore(sink->error());
  if (!sink->write(text) || !sink->flush()) {
    const std::string msg = sink->error();
    const std::string opened = sink->path();
    const bool closed = sink->close().has_value();
    std::error_code ec;
    std::filesystem::remove(opened, ec);
    return restore(closed ? msg : msg + "; " + sink->error());
  }
  sink_ = std::move(sink);
  rows_.clear();
  return true;
}

std::optional<std::string> Dataset::close_stream() {
  if (!sink_) {
    fail("no stream is open");
    return std::nullopt;
  }
  auto p = sink_->close();
  if (!p) fail(sink_->error());
  sink_.reset();
  return p;
}

bool Dataset::flush() {
  if (sink_ && !sink_->flush()) return fail(sink_->error());
  return true;
}

bool Dataset::streaming() const noexcept { return sink_ && sink_->is_open(); }

std::optional<std::string> Dataset::write(const WriteOptions& opt) const {
  if (opt.schema_only && opt.data_only) {
    fail("schema_only and data_only are mutually exclusive");
    return std::nullopt;
  }
  ArffWriter w(schema_);
  std::string out;
  if (!opt.data_only) out += w.write_header();
  if (!opt.schema_only) {
    out += "@data\n";
    for (std::size_t i = 0; i < rows_.size(); ++i) {
      std::optional<std::string> line;
      if (!w.write_line(rows_[i], opt.format, line)) {
        fail("row " + std::to_string(i) + ": " + w.error());
        return std::nullopt;
      }
      if (line) { out += *line; out += '\n'; }
    }
  }
  return out;
}

bool Dataset::save(std::string path, const WriteOptions& opt) {
  if (path.empty()) path = source_path_;
  if (path.empty()) return fail("no path to save to");
  auto text = write(opt);
  if (!text) return false;
  if (!ensure_parent_dirs(path)) return fail("cannot create parent directories for " + path);
  std::ofstream out(path, std::ios::binary);
  if (!out) return fail("failed to open " + path + " for writing");
  out.write(text->data(), static_cast<std::streamsize>(text->size()));
  if (!out) return fail("failed to write " + path);
  return true;
}

std::optional<NamedRow> Dataset::named_row(std::size_t i) const {
  if (i >= rows_.size()) {
    fail("row index " + std::to_string(i) + " out of range");
    return std::nullopt;
  }
  if (auto* n = std::get_if<NamedRow>(&rows_[i])) return *n;
  return to_named_row(schema_, std::get<DenseRow>(rows_[i]), &err_);
}

std::optional<Cell> Dataset::attribute_value(std::string_view name, std::string_view token) const {
  static const ParsePolicy policy{};
  const AttributeSpec* a = schema_.find(name);
  if (!a) {
    fail("unknown attribute '" + std::string(name) + "'");
    return std::nullopt;
  }
  token = trim(token);
  if (token == kMissing) return Cell(Missing{});

  switch (a->kind) {
    case Kind::Integer:
      if (auto i = policy.parse_integer(token)) return Cell(*i);
      break;
    case Kind::Numeric:
      if (auto d = Decimal::parse(token)) return Cell(std::move(*d));
      break;
    case Kind::Nominal: {
      // Weka prediction output: "<index>:<value>"
      const auto colon = token.find(':');
      if (colon == std::string_view::npos) break;
      const std::string value(token.substr(colon + 1));
      if (value == kMissing) return Cell(Missing{});
      if (!a->allows(value)) {
        std::string allowed;
        for (const auto& v : a->nominal_values) { if (!allowed.empty()) allowed += ", "; allowed += v; }
        fail("Predicted value \"" + value + "\" but only values " + allowed + " are allowed.");
        return std::nullopt;
      }
      return Cell(value);
    }
    case Kind::String:
    case Kind::Date:
      fail("values of " + std::string(kind_name(a->kind)) + " attribute " + a->name +
           " cannot be decoded");
      return std::nullopt;
  }
  fail("invalid value '" + std::string(token) + "' for attribute " + a->name);
  return std::nullopt;
}

std::string Dataset::describe() const {
  std::string out = "Relation " + schema_.relation() + "\n  With attributes\n";
  for (const auto& a : schema_.attributes()) {
    out += "    " + a.name + " of type " + std::string(kind_name(a.kind));
    if (a.kind == Kind::Nominal) {
      out += " with values ";
      bool first = true;
      for (const auto& v : a.nominal_values) { if (!first) out += ", "; out += v; first = false; }
    } else if (a.kind == Kind::Date) {
      out += " (" + std::string(a.effective_date_pattern()) + ")";
    }
    if (schema_.class_attribute() && *schema_.class_attribute() == a.name) out += " [class]";
    out += "\n";
  }
  for (const auto& r : rows_) {
    if (auto* d = std::get_if<DenseRow>(&r)) {
      out += "[";
      for (std::size_t i = 0; i < d->size(); ++i) { if (i) out += ", "; out += cell_text((*d)[i]); }
      out += "]\n";
    } else {
      out += "{";
      bool first = true;
      for (const auto& [k, v] : std::get<NamedRow>(r)) {
        if (!first) out += ", ";
        out += k + ": " + v.text();
        first = false;
      }
      out += "}\n";
    }
  }
  return out;
}

}

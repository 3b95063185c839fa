#include "util/notebook.hpp"

#include <capnp/compat/json.h>
#include <capnp/message.h>
#include <kj/debug.h>

#include <sstream>

namespace util {

namespace {

using capnp::JsonValue;

kj::Maybe<JsonValue::Reader> Field(JsonValue::Reader object,
                                   kj::StringPtr name) {
  for (JsonValue::Field::Reader field : object.getObject()) {
    if (field.getName() == name) return field.getValue();
  }
  return nullptr;
}

// Sources are either a string or a list of lines.
std::string CellSource(JsonValue::Reader source) {
  if (source.isString()) return source.getString().cStr();
  KJ_REQUIRE(source.isArray(), "Cell source must be a string or a list");
  std::string text;
  for (JsonValue::Reader line : source.getArray()) {
    KJ_REQUIRE(line.isString(), "Cell source lines must be strings");
    text += line.getString().cStr();
  }
  return text;
}

std::string CommentOutMagics(const std::string& source) {
  std::istringstream in(source);
  std::string result;
  std::string line;
  while (std::getline(in, line)) {
    size_t first = line.find_first_not_of(" \t");
    if (first != std::string::npos &&
        (line[first] == '%' || line[first] == '!')) {
      line.insert(first, "# ");
    }
    result += line + "\n";
  }
  return result;
}

}  // namespace

std::string NotebookToScript(const std::string& json) {
  capnp::JsonCodec codec;
  capnp::MallocMessageBuilder message;
  JsonValue::Builder root = message.initRoot<JsonValue>();
  codec.decodeRaw(kj::ArrayPtr<const char>(json.data(), json.size()), root);
  JsonValue::Reader notebook = root.asReader();
  KJ_REQUIRE(notebook.isObject(), "A notebook must be a JSON object");

  kj::Maybe<JsonValue::Reader> maybe_cells = Field(notebook, "cells");
  JsonValue::Reader cells;
  KJ_IF_MAYBE(value, maybe_cells) { cells = *value; }
  else {
    KJ_FAIL_REQUIRE("The notebook has no cells");
  }
  KJ_REQUIRE(cells.isArray(), "The notebook cells must be a list");

  std::string script;
  for (JsonValue::Reader cell : cells.getArray()) {
    KJ_REQUIRE(cell.isObject(), "A notebook cell must be an object");
    kj::Maybe<JsonValue::Reader> type = Field(cell, "cell_type");
    kj::Maybe<JsonValue::Reader> source = Field(cell, "source");
    bool is_code = false;
    KJ_IF_MAYBE(t, type) {
      is_code = t->isString() && t->getString() == "code";
    }
    if (!is_code) continue;
    KJ_IF_MAYBE(src, source) { script += CommentOutMagics(CellSource(*src)); }
  }
  return script;
}

}  // namespace util

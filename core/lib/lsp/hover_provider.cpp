// frugal_ls/lsp/hover_provider.cpp
#include "frugal_ls/lsp/hover_provider.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <array>
#include <utility>

#include "frugal_ls/lsp/reference_finder.hpp"
#include "frugal_ls/sema/symbol_extractor.hpp"
#include "frugal_ls/syntax/node_kinds.hpp"
#include "frugal_ls/syntax/node_utils.hpp"

namespace frugal_ls::lsp
{

namespace
{

namespace k = syntax::kind;

struct Entry
{
  std::string_view word;
  std::string_view text;
};

constexpr std::array<Entry, 14> k_builtin_types = {{
  {"bool", "Boolean value (true/false)"},
  {"byte", "8-bit signed integer (-128 to 127)"},
  {"i8", "8-bit signed integer (-128 to 127)"},
  {"i16", "16-bit signed integer (-32,768 to 32,767)"},
  {"i32", "32-bit signed integer (-2^31 to 2^31-1)"},
  {"i64", "64-bit signed integer (-2^63 to 2^63-1)"},
  {"double", "64-bit floating point number"},
  {"string", "UTF-8 encoded string"},
  {"binary", "Byte array/binary data"},
  {"uuid", "Universally unique identifier"},
  {"void", "No return value"},
  {"list", "Ordered collection of elements"},
  {"set", "Unordered collection of unique elements"},
  {"map", "Key-value mapping"},
}};

constexpr std::array<Entry, 15> k_keywords = {{
  {"include", "**Keyword**: `include`\n\nImports definitions from another Frugal file."},
  {"namespace", "**Keyword**: `namespace`\n\nDefines the namespace/package for generated code."},
  {"const", "**Keyword**: `const`\n\nDefines a constant value."},
  {"typedef", "**Keyword**: `typedef`\n\nCreates a type alias."},
  {"struct", "**Keyword**: `struct`\n\nDefines a data structure with named fields."},
  {"enum", "**Keyword**: `enum`\n\nDefines an enumeration type with named values."},
  {"exception", "**Keyword**: `exception`\n\nDefines an exception type that can be thrown."},
  {"service", "**Keyword**: `service`\n\nDefines an RPC service with methods."},
  {"scope", "**Keyword**: `scope`\n\nDefines a pub/sub scope for event messaging."},
  {"oneway", "**Keyword**: `oneway`\n\nMethod modifier indicating no response is expected."},
  {"throws", "**Keyword**: `throws`\n\nSpecifies exceptions that a method can throw."},
  {"extends", "**Keyword**: `extends`\n\nIndicates inheritance from another service."},
  {"required", "**Keyword**: `required`\n\nField modifier indicating the field must be set."},
  {"optional", "**Keyword**: `optional`\n\nField modifier indicating the field is optional."},
  {"prefix", "**Keyword**: `prefix`\n\nDefines the topic prefix for pub/sub messaging."},
}};

template <size_t N>
std::string_view lookup(const std::array<Entry, N> & table, std::string_view word) noexcept
{
  for (const auto & e : table) {
    if (e.word == word) return e.text;
  }
  return {};
}

std::string_view heading(SymbolKind kind) noexcept
{
  switch (kind) {
    case SymbolKind::Service:
      return "Service";
    case SymbolKind::Scope:
      return "Scope";
    case SymbolKind::Struct:
      return "Struct";
    case SymbolKind::Enum:
      return "Enum";
    case SymbolKind::Const:
      return "Constant";
    case SymbolKind::Typedef:
      return "Type Alias";
    case SymbolKind::Exception:
      return "Exception";
    default:
      break;
  }
  return display_name(kind);
}

std::string_view summary(SymbolKind kind) noexcept
{
  switch (kind) {
    case SymbolKind::Service:
      return "Service definition with RPC methods.";
    case SymbolKind::Scope:
      return "Pub/sub scope for event messaging.";
    case SymbolKind::Struct:
      return "Data structure definition.";
    case SymbolKind::Enum:
      return "Enumeration type.";
    case SymbolKind::Exception:
      return "Exception type definition.";
    default:
      break;
  }
  return {};
}

std::string_view members_heading(SymbolKind kind) noexcept
{
  switch (kind) {
    case SymbolKind::Service:
      return "Methods";
    case SymbolKind::Scope:
      return "Events";
    case SymbolKind::Enum:
      return "Values";
    default:
      break;
  }
  return "Fields";
}

// Source text of a member on one line, without the trailing list separator.
std::string one_line(std::string_view text)
{
  std::string out;
  bool pending_space = false;
  for (const char c : text) {
    if (c == ' ' || c == '\t' || c == '\r' || c == '\n') {
      pending_space = !out.empty();
      continue;
    }
    if (pending_space) out.push_back(' ');
    pending_space = false;
    out.push_back(c);
  }
  while (!out.empty() && (out.back() == ',' || out.back() == ';')) out.pop_back();
  return out;
}

std::string child_text(ts_ll::Node n, std::string_view kind, const SourceManager & sm)
{
  return one_line(syntax::first_child_of_kind(n, kind).text(sm));
}

std::string describe_symbol(const Symbol & sym, const Document & owner, bool is_origin)
{
  const SourceManager & sm = owner.source();
  std::string md;

  switch (sym.kind) {
    case SymbolKind::Const:
      md = fmt::format(
        "**Constant**: `{} {} = {}`", child_text(sym.node, k::k_field_type, sm), sym.name,
        child_text(sym.node, k::k_const_value, sm));
      break;
    case SymbolKind::Typedef:
      md = fmt::format(
        "**Type Alias**: `{}` -> `{}`", sym.name, child_text(sym.node, k::k_field_type, sm));
      break;
    default: {
      md = fmt::format("**{}**: `{}`\n\n{}", heading(sym.kind), sym.name, summary(sym.kind));
      const auto members = extract_members(sym, sm);
      if (!members.empty()) {
        md += fmt::format("\n\n**{}:**", members_heading(sym.kind));
        for (const auto & m : members) {
          md += fmt::format("\n- `{}`", one_line(m.node.text(sm)));
        }
      }
      break;
    }
  }

  const Position at = sym.declaration_range.start;
  md += fmt::format("\n\n*Defined at line {}, column {}", at.line + 1, at.character + 1);
  if (!is_origin) {
    md += fmt::format(" in {}", owner.uri());
  }
  md += "*";
  return md;
}

}  // namespace

HoverProvider::HoverProvider() : extensions_(default_file_extensions()) {}

HoverProvider::HoverProvider(std::vector<std::string> extensions)
: extensions_(std::move(extensions))
{
}

std::string_view HoverProvider::builtin_type_description(std::string_view name) noexcept
{
  return lookup(k_builtin_types, name);
}

std::string_view HoverProvider::keyword_description(std::string_view word) noexcept
{
  return lookup(k_keywords, word);
}

std::optional<Hover> HoverProvider::hover(
  const Document & doc, Position pos, const DocumentSet & docs) const
{
  if (!doc.has_tree()) return std::nullopt;

  if (const auto symbol = ReferenceFinder::symbol_at(doc, pos)) {
    auto find_in = [&](const Document & d) -> std::optional<Hover> {
      for (const auto & sym : d.symbols()) {
        if (sym.name == symbol->name) {
          return Hover{describe_symbol(sym, d, &d == &doc), symbol->range};
        }
      }
      return std::nullopt;
    };

    if (auto h = find_in(doc)) return h;
    for (const auto & [uri, other] : docs) {
      if (other == nullptr || uri == doc.uri()) continue;
      if (!other->is_analyzable(extensions_)) continue;
      if (auto h = find_in(*other)) return h;
    }

    if (const auto info = builtin_type_description(symbol->name); !info.empty()) {
      return Hover{fmt::format("**Type**: `{}`\n\n{}", symbol->name, info), symbol->range};
    }

    spdlog::debug("hover: no definition for '{}'", symbol->name);
    return std::nullopt;
  }

  // Keywords and `void` are anonymous tokens
  const auto offset = doc.source().offset_at(pos);
  if (!offset) return std::nullopt;

  const ts_ll::Node token = syntax::deepest_node_at(doc.root(), *offset);
  if (token.is_null() || token.is_named()) return std::nullopt;

  const std::string_view word = token.kind();
  if (const auto info = builtin_type_description(word); !info.empty()) {
    return Hover{fmt::format("**Type**: `{}`\n\n{}", word, info), token.position_range()};
  }
  if (const auto info = keyword_description(word); !info.empty()) {
    return Hover{std::string(info), token.position_range()};
  }
  return std::nullopt;
}

}  // namespace frugal_ls::lsp

// frugal_ls/lsp/workspace.cpp - Workspace facade over the language features
#include <map>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <string>
#include <string_view>
#include <utility>

#include "frugal_ls/document/document.hpp"
#include "frugal_ls/lsp.hpp"
#include "frugal_ls/lsp/definition_provider.hpp"
#include "frugal_ls/lsp/document_symbols.hpp"
#include "frugal_ls/lsp/highlight_provider.hpp"
#include "frugal_ls/lsp/hover_provider.hpp"
#include "frugal_ls/lsp/lsp_json.hpp"
#include "frugal_ls/lsp/reference_finder.hpp"
#include "frugal_ls/lsp/rename_provider.hpp"
#include "frugal_ls/sema/diagnostics_engine.hpp"

namespace frugal_ls::lsp
{

namespace
{

// Document text and client-supplied names may hold invalid UTF-8
std::string dump(const json & j)
{
  return j.dump(-1, ' ', false, json::error_handler_t::replace);
}

}  // namespace

struct Workspace::Impl
{
  ProjectConfig config;
  std::map<std::string, Document, std::less<>> docs;

  explicit Impl(ProjectConfig cfg) : config(std::move(cfg)) {}

  [[nodiscard]] ParseOptions parse_options() const
  {
    ParseOptions opts;
    opts.max_syntax_errors = config.diagnostics.max_syntax_errors;
    return opts;
  }

  const Document * get_doc(std::string_view uri) const
  {
    auto it = docs.find(uri);
    if (it == docs.end()) {
      return nullptr;
    }
    return &it->second;
  }

  /// Snapshot of every held document for one request
  [[nodiscard]] DocumentSet snapshot() const
  {
    DocumentSet set;
    for (const auto & [uri, doc] : docs) {
      set.emplace(uri, &doc);
    }
    return set;
  }

  void set_document(std::string uri, std::string text)
  {
    Document doc = Document::parse(uri, std::move(text), parse_options());
    spdlog::trace(
      "workspace: set {} ({} syntax error(s))", doc.uri(), doc.syntax_errors().size());
    docs.insert_or_assign(std::move(uri), std::move(doc));
  }

  void reparse_all()
  {
    std::map<std::string, Document, std::less<>> reparsed;
    for (auto & [uri, doc] : docs) {
      reparsed.emplace(uri, Document::parse(uri, std::string(doc.text()), parse_options()));
    }
    docs = std::move(reparsed);
  }

  json diagnostics_json_impl(std::string_view uri) const
  {
    json out;
    out["uri"] = std::string(uri);
    out["items"] = json::array();

    const auto * doc = get_doc(uri);
    if (doc == nullptr) {
      return out;
    }

    const DiagnosticsEngine engine(config.diagnostics);
    for (const auto & d : engine.run(*doc)) {
      out["items"].push_back(diagnostic_to_json(d, uri));
    }
    return out;
  }

  json hover_json_impl(std::string_view uri, Position pos) const
  {
    json out;
    out["uri"] = std::string(uri);
    out["contents"] = nullptr;
    out["range"] = nullptr;

    const auto * doc = get_doc(uri);
    if (doc == nullptr) {
      return out;
    }

    const HoverProvider provider(config.files.extensions);
    if (const auto hover = provider.hover(*doc, pos, snapshot())) {
      const json h = hover_to_json(*hover);
      out["contents"] = h["contents"];
      out["range"] = h["range"];
    }
    return out;
  }

  json references_json_impl(std::string_view uri, Position pos, bool include_declaration) const
  {
    json out;
    out["locations"] = json::array();

    const auto * doc = get_doc(uri);
    if (doc == nullptr) {
      return out;
    }

    const ReferenceFinder finder{};
    for (const auto & loc : finder.find_references(*doc, pos, include_declaration, snapshot())) {
      out["locations"].push_back(location_to_json(loc));
    }
    return out;
  }

  json definition_json_impl(std::string_view uri, Position pos) const
  {
    json out;
    out["locations"] = json::array();

    const auto * doc = get_doc(uri);
    if (doc == nullptr) {
      return out;
    }

    const DefinitionProvider provider(config.files.extensions);
    for (const auto & loc : provider.definition(*doc, pos, snapshot())) {
      out["locations"].push_back(location_to_json(loc));
    }
    return out;
  }

  json rename_json_impl(std::string_view uri, Position pos, std::string_view new_name) const
  {
    const auto * doc = get_doc(uri);
    if (doc == nullptr) {
      return json{{"error", "document not found: " + std::string(uri)}};
    }

    const RenameProvider provider{};
    const RenameResult result = provider.rename(*doc, pos, new_name, snapshot());
    if (!result.success) {
      return json{{"error", result.error}};
    }
    return workspace_edit_to_json(result.edit);
  }

  json prepare_rename_json_impl(std::string_view uri, Position pos) const
  {
    const auto * doc = get_doc(uri);
    if (doc == nullptr) {
      return json{{"error", "document not found: " + std::string(uri)}};
    }

    const RenameProvider provider{};
    const PrepareRenameResult result = provider.prepare_rename(*doc, pos);
    if (!result.success) {
      return json{{"error", result.error}};
    }
    return json{{"range", range_to_json(result.range)}, {"placeholder", result.placeholder}};
  }

  json document_highlights_json_impl(std::string_view uri, Position pos) const
  {
    json out;
    out["items"] = json::array();

    const auto * doc = get_doc(uri);
    if (doc == nullptr) {
      return out;
    }

    const HighlightProvider provider{};
    for (const auto & h : provider.highlights(*doc, pos)) {
      out["items"].push_back(highlight_to_json(h));
    }
    return out;
  }

  json document_symbols_json_impl(std::string_view uri) const
  {
    json out;
    out["items"] = json::array();

    const auto * doc = get_doc(uri);
    if (doc == nullptr) {
      return out;
    }

    for (const auto & sym : document_symbols(*doc)) {
      out["items"].push_back(document_symbol_to_json(sym));
    }
    return out;
  }

  json workspace_symbols_json_impl(std::string_view query) const
  {
    json out;
    out["items"] = json::array();

    for (const auto & info : workspace_symbols(query, snapshot(), config.files.extensions)) {
      out["items"].push_back(symbol_information_to_json(info));
    }
    return out;
  }
};

// ============================================================================
// Workspace
// ============================================================================

Workspace::Workspace() : impl_(new Impl(ProjectConfig{})) {}

Workspace::Workspace(ProjectConfig config) : impl_(new Impl(std::move(config))) {}

Workspace::~Workspace() { delete impl_; }

Workspace::Workspace(Workspace && other) noexcept : impl_(other.impl_) { other.impl_ = nullptr; }

Workspace & Workspace::operator=(Workspace && other) noexcept
{
  if (this == &other) {
    return *this;
  }
  delete impl_;
  impl_ = other.impl_;
  other.impl_ = nullptr;
  return *this;
}

void Workspace::set_config(ProjectConfig config)
{
  impl_->config = std::move(config);
  impl_->reparse_all();
}

const ProjectConfig & Workspace::config() const noexcept { return impl_->config; }

void Workspace::set_document(std::string uri, std::string text)
{
  impl_->set_document(std::move(uri), std::move(text));
}

void Workspace::remove_document(std::string_view uri)
{
  auto it = impl_->docs.find(uri);
  if (it != impl_->docs.end()) {
    impl_->docs.erase(it);
  }
}

bool Workspace::has_document(std::string_view uri) const
{
  return impl_->docs.find(uri) != impl_->docs.end();
}

std::string Workspace::diagnostics_json(std::string_view uri)
{
  return dump(impl_->diagnostics_json_impl(uri));
}

std::string Workspace::hover_json(std::string_view uri, uint32_t line, uint32_t character)
{
  return dump(impl_->hover_json_impl(uri, Position{line, character}));
}

std::string Workspace::references_json(
  std::string_view uri, uint32_t line, uint32_t character, bool include_declaration)
{
  return dump(
    impl_->references_json_impl(uri, Position{line, character}, include_declaration));
}

std::string Workspace::definition_json(std::string_view uri, uint32_t line, uint32_t character)
{
  return dump(impl_->definition_json_impl(uri, Position{line, character}));
}

std::string Workspace::rename_json(
  std::string_view uri, uint32_t line, uint32_t character, std::string_view new_name)
{
  return dump(impl_->rename_json_impl(uri, Position{line, character}, new_name));
}

std::string Workspace::prepare_rename_json(
  std::string_view uri, uint32_t line, uint32_t character)
{
  return dump(impl_->prepare_rename_json_impl(uri, Position{line, character}));
}

std::string Workspace::document_highlights_json(
  std::string_view uri, uint32_t line, uint32_t character)
{
  return dump(impl_->document_highlights_json_impl(uri, Position{line, character}));
}

std::string Workspace::document_symbols_json(std::string_view uri)
{
  return dump(impl_->document_symbols_json_impl(uri));
}

std::string Workspace::workspace_symbols_json(std::string_view query)
{
  return dump(impl_->workspace_symbols_json_impl(query));
}

}  // namespace frugal_ls::lsp

// frugal_ls/sema/diagnostics_engine.cpp
#include "frugal_ls/sema/diagnostics_engine.hpp"

#include <spdlog/spdlog.h>

#include "frugal_ls/sema/checks/duplicate_definition_checker.hpp"
#include "frugal_ls/sema/checks/field_id_checker.hpp"
#include "frugal_ls/sema/checks/naming_convention_checker.hpp"
#include "frugal_ls/sema/checks/type_reference_checker.hpp"

namespace frugal_ls
{

namespace
{

void forward_syntax_errors(const Document & doc, size_t limit, DiagnosticBag & diags)
{
  size_t count = 0;
  for (const auto & err : doc.syntax_errors()) {
    if (limit != 0 && count >= limit) break;
    ++count;

    Range r;
    r.start = err.position;
    r.end = Position{err.position.line, err.position.character + 1};

    const bool missing = err.message.rfind("Missing", 0) == 0;
    diags.report_error(r, err.message)
      .with_code(missing ? diag_code::k_missing_token : diag_code::k_syntax_error);
  }
}

}  // namespace

std::vector<Diagnostic> DiagnosticsEngine::run(const Document & doc) const
{
  DiagnosticBag diags;

  forward_syntax_errors(doc, options_.max_syntax_errors, diags);

  if (!doc.has_tree()) {
    spdlog::debug("diagnostics: no syntax tree for {}", doc.uri());
    return diags.take();
  }

  const std::vector<Symbol> symbols = doc.symbols();
  const ts_ll::Node root = doc.root();

  DuplicateDefinitionChecker duplicates(&diags);
  duplicates.check(symbols, doc.uri());

  FieldIdChecker field_ids(&diags);
  field_ids.check(root, doc.source(), doc.uri());

  if (options_.naming_conventions) {
    NamingConventionChecker naming(&diags);
    naming.check(symbols);
  }

  if (options_.type_references) {
    TypeReferenceChecker types(&diags);
    types.check(root, doc.source(), symbols);
  }

  spdlog::debug("diagnostics: {} item(s) for {}", diags.size(), doc.uri());
  return diags.take();
}

}  // namespace frugal_ls

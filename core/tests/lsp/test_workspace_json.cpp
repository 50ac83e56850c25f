// test_workspace_json.cpp - Serverless Workspace facade tests (JSON shapes)

#include <gtest/gtest.h>

#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>

#include "frugal_ls/lsp.hpp"

using json = nlohmann::json;

static constexpr const char * k_user_uri = "file:///idl/user.frugal";
static constexpr const char * k_api_uri = "file:///idl/api.frugal";

static std::string user_source()
{
  return "struct User {\n"
         "  1: string name\n"
         "}\n"
         "struct User {\n"
         "  1: string email\n"
         "}\n";
}

static std::string api_source()
{
  return "service UserApi {\n"
         "  User getUser(1: i64 userId)\n"
         "}\n";
}

TEST(LspWorkspaceJson, DiagnosticsShape)
{
  frugal_ls::lsp::Workspace ws;
  ws.set_document(k_user_uri, user_source());

  const auto j = json::parse(ws.diagnostics_json(k_user_uri));
  EXPECT_EQ(j["uri"], k_user_uri);
  ASSERT_TRUE(j["items"].is_array());
  ASSERT_EQ(j["items"].size(), 1U);

  const auto & item = j["items"][0];
  EXPECT_EQ(item["severity"], 1);
  EXPECT_EQ(item["source"], "frugal-ls");
  EXPECT_EQ(item["code"], "E0101");
  EXPECT_EQ(item["message"], "Duplicate struct definition 'User'");
  EXPECT_EQ(item["range"]["start"]["line"], 3);
  EXPECT_EQ(item["range"]["start"]["character"], 7);
  EXPECT_EQ(item["range"]["end"]["character"], 11);

  ASSERT_EQ(item["relatedInformation"].size(), 1U);
  const auto & rel = item["relatedInformation"][0];
  EXPECT_EQ(rel["location"]["uri"], k_user_uri);
  EXPECT_EQ(rel["location"]["range"]["start"]["line"], 0);
  EXPECT_EQ(rel["message"], "First definition of 'User' here");
}

TEST(LspWorkspaceJson, WarningSeverity)
{
  frugal_ls::lsp::Workspace ws;
  ws.set_document(k_user_uri, "struct lower {}\n");

  const auto j = json::parse(ws.diagnostics_json(k_user_uri));
  ASSERT_EQ(j["items"].size(), 1U);
  EXPECT_EQ(j["items"][0]["severity"], 2);
  EXPECT_EQ(j["items"][0]["code"], "W0301");
}

TEST(LspWorkspaceJson, UnknownDocument)
{
  frugal_ls::lsp::Workspace ws;

  EXPECT_TRUE(json::parse(ws.diagnostics_json("file:///missing.frugal"))["items"].empty());
  EXPECT_TRUE(json::parse(ws.references_json("file:///missing.frugal", 0, 0, true))["locations"]
                .empty());
  EXPECT_TRUE(json::parse(ws.rename_json("file:///missing.frugal", 0, 0, "X")).contains("error"));
}

TEST(LspWorkspaceJson, ReferencesAcrossDocuments)
{
  frugal_ls::lsp::Workspace ws;
  ws.set_document(k_user_uri, user_source());
  ws.set_document(k_api_uri, api_source());

  const auto with_decl = json::parse(ws.references_json(k_api_uri, 1, 3, true));
  const auto without_decl = json::parse(ws.references_json(k_api_uri, 1, 3, false));

  ASSERT_EQ(with_decl["locations"].size(), 3U);
  EXPECT_EQ(with_decl["locations"][0]["uri"], k_api_uri);
  EXPECT_EQ(without_decl["locations"].size(), 1U);
}

TEST(LspWorkspaceJson, RenameProducesWorkspaceEdit)
{
  frugal_ls::lsp::Workspace ws;
  ws.set_document(k_user_uri, "struct User {}\n");
  ws.set_document(k_api_uri, api_source());

  const auto j = json::parse(ws.rename_json(k_user_uri, 0, 8, "Person"));
  ASSERT_TRUE(j.contains("changes")) << j.dump();
  ASSERT_EQ(j["changes"].size(), 2U);

  const auto & api_edits = j["changes"][k_api_uri];
  ASSERT_EQ(api_edits.size(), 1U);
  EXPECT_EQ(api_edits[0]["newText"], "Person");
  EXPECT_EQ(api_edits[0]["range"]["start"]["line"], 1);
  EXPECT_EQ(api_edits[0]["range"]["start"]["character"], 2);
}

TEST(LspWorkspaceJson, RenameErrors)
{
  frugal_ls::lsp::Workspace ws;
  ws.set_document(k_user_uri, "struct User {}\n");

  const auto j = json::parse(ws.rename_json(k_user_uri, 0, 8, "enum"));
  EXPECT_EQ(j["error"], "'enum' is a reserved keyword and cannot be used as an identifier");

  const auto p = json::parse(ws.prepare_rename_json(k_user_uri, 0, 8));
  EXPECT_EQ(p["placeholder"], "User");
  EXPECT_EQ(p["range"]["start"]["character"], 7);
}

TEST(LspWorkspaceJson, RenameWithInvalidUtf8NameIsAnError)
{
  frugal_ls::lsp::Workspace ws;
  ws.set_document(k_user_uri, "struct User {}\n");

  std::string out;
  ASSERT_NO_THROW(out = ws.rename_json(k_user_uri, 0, 8, "\xff"));

  const auto j = json::parse(out);
  ASSERT_TRUE(j.contains("error")) << out;
  EXPECT_NE(j["error"].get<std::string>().find("is not a valid identifier"), std::string::npos);
}

TEST(LspWorkspaceJson, HoverShape)
{
  frugal_ls::lsp::Workspace ws;
  ws.set_document(k_user_uri, "struct User {}\n");
  ws.set_document(k_api_uri, api_source());

  const auto j = json::parse(ws.hover_json(k_api_uri, 1, 3));
  EXPECT_EQ(j["uri"], k_api_uri);
  EXPECT_EQ(j["contents"]["kind"], "markdown");
  EXPECT_EQ(
    j["contents"]["value"],
    "**Struct**: `User`\n\nData structure definition.\n\n"
    "*Defined at line 1, column 8 in file:///idl/user.frugal*");
  EXPECT_EQ(j["range"]["start"]["line"], 1);
  EXPECT_EQ(j["range"]["start"]["character"], 2);
  EXPECT_EQ(j["range"]["end"]["character"], 6);

  const auto blank = json::parse(ws.hover_json(k_api_uri, 2, 1));
  EXPECT_TRUE(blank["contents"].is_null());
  EXPECT_TRUE(blank["range"].is_null());

  const auto missing = json::parse(ws.hover_json("file:///missing.frugal", 0, 0));
  EXPECT_TRUE(missing["contents"].is_null());
}

TEST(LspWorkspaceJson, HighlightsAndDefinition)
{
  frugal_ls::lsp::Workspace ws;
  ws.set_document(k_user_uri, "struct User {}\n");
  ws.set_document(k_api_uri, api_source());

  const auto h = json::parse(ws.document_highlights_json(k_api_uri, 1, 3));
  ASSERT_EQ(h["items"].size(), 1U);
  EXPECT_EQ(h["items"][0]["kind"], 2);

  const auto d = json::parse(ws.definition_json(k_api_uri, 1, 3));
  ASSERT_EQ(d["locations"].size(), 1U);
  EXPECT_EQ(d["locations"][0]["uri"], k_user_uri);
}

TEST(LspWorkspaceJson, SymbolsJson)
{
  frugal_ls::lsp::Workspace ws;
  ws.set_document(k_api_uri, api_source());

  const auto outline = json::parse(ws.document_symbols_json(k_api_uri));
  ASSERT_EQ(outline["items"].size(), 1U);
  EXPECT_EQ(outline["items"][0]["name"], "UserApi");
  EXPECT_EQ(outline["items"][0]["kind"], 5);
  EXPECT_EQ(outline["items"][0]["detail"], "Service");
  ASSERT_EQ(outline["items"][0]["children"].size(), 1U);
  EXPECT_EQ(outline["items"][0]["children"][0]["kind"], 6);
  EXPECT_TRUE(outline["items"][0].contains("selectionRange"));

  const auto found = json::parse(ws.workspace_symbols_json("api"));
  ASSERT_EQ(found["items"].size(), 1U);
  EXPECT_EQ(found["items"][0]["location"]["uri"], k_api_uri);
}

TEST(LspWorkspaceJson, ConfigDisablesPasses)
{
  frugal_ls::ProjectConfig cfg;
  cfg.diagnostics.naming_conventions = false;

  frugal_ls::lsp::Workspace ws(cfg);
  ws.set_document(k_user_uri, "struct lower {}\n");
  EXPECT_TRUE(json::parse(ws.diagnostics_json(k_user_uri))["items"].empty());

  cfg.diagnostics.naming_conventions = true;
  ws.set_config(cfg);
  EXPECT_EQ(json::parse(ws.diagnostics_json(k_user_uri))["items"].size(), 1U);
}

TEST(LspWorkspaceJson, DocumentLifecycle)
{
  frugal_ls::lsp::Workspace ws;
  ws.set_document(k_user_uri, "struct User {}\n");
  EXPECT_TRUE(ws.has_document(k_user_uri));

  ws.remove_document(k_user_uri);
  EXPECT_FALSE(ws.has_document(k_user_uri));

  frugal_ls::lsp::Workspace moved(std::move(ws));
  EXPECT_FALSE(moved.has_document(k_user_uri));
}

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <docbox/policy.h>

TEST(Policy, DefaultImports) {
  Policy policy = Policy::Default();
  for (auto name : {"docx", "pptx", "canvas", "os", "json", "re", "math", "string", "utf8"}) {
    EXPECT_TRUE(policy.IsImportAllowed(name)) << name;
  }
  for (auto name : {"sys", "socket", "io", "debug", "package", "subprocess", ""}) {
    EXPECT_FALSE(policy.IsImportAllowed(name)) << name;
  }
}

TEST(Policy, TopLevelDecides) {
  Policy policy = Policy::Default();
  EXPECT_EQ(TopLevelName("os.path"), "os");
  EXPECT_EQ(TopLevelName("socket"), "socket");
  EXPECT_TRUE(policy.IsImportAllowed("os.path"));
  EXPECT_FALSE(policy.IsImportAllowed("socket.core"));
  EXPECT_FALSE(policy.IsImportAllowed(".os"));
}

TEST(Policy, Extensions) {
  Policy policy = Policy::Default();
  EXPECT_TRUE(policy.IsOutputExtensionAllowed("docx", "a.docx"));
  EXPECT_TRUE(policy.IsOutputExtensionAllowed("docx", "A.PDF"));
  EXPECT_FALSE(policy.IsOutputExtensionAllowed("docx", "a.pptx"));
  EXPECT_TRUE(policy.IsOutputExtensionAllowed("canvas", "chart.pdf"));
  EXPECT_FALSE(policy.IsOutputExtensionAllowed("canvas", "chart.docx"));
  EXPECT_FALSE(policy.IsOutputExtensionAllowed("canvas", ".pdf"));
  EXPECT_FALSE(policy.IsOutputExtensionAllowed("canvas", "pdf"));
  EXPECT_FALSE(policy.IsOutputExtensionAllowed("os", "a.pdf"));
  EXPECT_FALSE(policy.IsOutputExtensionAllowed("unknown", "a.pdf"));
  EXPECT_TRUE(policy.IsPermittedOutput("deck.pptx"));
  EXPECT_FALSE(policy.IsPermittedOutput("run.sh"));
  EXPECT_TRUE(policy.AllowedExtensions("sys").empty());
}

TEST(Policy, LowerExtension) {
  EXPECT_EQ(LowerExtension("Report.PDF"), ".pdf");
  EXPECT_EQ(LowerExtension("a.tar.GZ"), ".gz");
  EXPECT_EQ(LowerExtension("dir.d/name"), "");
  EXPECT_EQ(LowerExtension(".bashrc"), "");
  EXPECT_EQ(LowerExtension("noext"), "");
}

TEST(Policy, WithExtensionsNormalizes) {
  Policy policy = Policy::Default().WithExtensions("canvas", {"PDF", ".pdf", "png", ""});
  EXPECT_EQ(policy.AllowedExtensions("canvas"), (std::vector<std::string>{".pdf", ".png"}));
  EXPECT_TRUE(policy.IsOutputExtensionAllowed("canvas", "x.PNG"));
  // the original is untouched
  EXPECT_FALSE(Policy::Default().IsOutputExtensionAllowed("canvas", "x.png"));
}

TEST(Policy, JsonRoundTrip) {
  Policy policy = Policy::Default().WithModules({"docx", "json"});
  Policy copy = Policy::FromJson(policy.ToJson());
  EXPECT_EQ(copy.Modules(), policy.Modules());
  EXPECT_EQ(copy.OutputCapabilities(), policy.OutputCapabilities());
  EXPECT_FALSE(copy.IsImportAllowed("os"));
}

TEST(Policy, MalformedJson) {
  EXPECT_THROW(Policy::FromJson(nlohmann::json::object()), std::invalid_argument);
  EXPECT_THROW(Policy::FromJson({{"modules", 3}, {"extensions", nlohmann::json::object()}}),
               std::invalid_argument);
  EXPECT_THROW(Policy::FromJson(nlohmann::json::array()), std::invalid_argument);
}

#include <sectla/clsJsonLayoutProvider.h>
#include <sectla/sectla.h>

#include <gtest/gtest.h>

#include "testHelpers.h"

using namespace Flint::WLA;
using namespace Flint::SectLA;
using Flint::SectLA::Test::clsElementBuilder;

namespace {

class clsFailingProvider : public intfLayoutProvider {
 public:
  stuLayoutSnapshot render(const stuRenderRequest& _request) override {
    throw exRenderFailure("navigation to `" + _request.Source + "` timed out");
  }
};

class clsFixedProvider : public intfLayoutProvider {
 public:
  stuRenderRequest LastRequest;

  stuLayoutSnapshot render(const stuRenderRequest& _request) override {
    this->LastRequest = _request;
    stuLayoutSnapshot Snapshot;
    Snapshot.Url = _request.Source;
    Snapshot.Elements = {clsElementBuilder(0, 0.f, 80.f).width(1280.f).build(),
                         clsElementBuilder(1, 300.f, 400.f).width(1280.f).build()};
    return Snapshot;
  }
};

}  // namespace

TEST(JsonLayoutProviderTest, LoadsSnapshotFiles) {
  clsJsonLayoutProvider Provider(SECTLA_TEST_DATA_DIR);
  auto Snapshot = Provider.render(
      stuRenderRequest{enuRenderSource::SnapshotFile, "sample_page.json", {}});
  EXPECT_EQ(Snapshot.Url, "https://example.com/");
  EXPECT_FLOAT_EQ(Snapshot.PageSize.Width, 1280.f);
  EXPECT_EQ(Snapshot.Elements.size(), 14u);

  clsJsonLayoutProvider Absolute;
  EXPECT_EQ(Absolute
                .render(stuRenderRequest{
                    enuRenderSource::SnapshotFile,
                    std::string(SECTLA_TEST_DATA_DIR) + "/sample_page.json",
                    {}})
                .Elements.size(),
            14u);
}

TEST(JsonLayoutProviderTest, OnlySnapshotFilesCanBeRendered) {
  clsJsonLayoutProvider Provider;
  EXPECT_THROW(Provider.render(stuRenderRequest{
                   enuRenderSource::Url, "https://example.com/", {}}),
               exRenderFailure);
  EXPECT_THROW(Provider.render(stuRenderRequest{enuRenderSource::Html,
                                                "<p>Hi</p>", {}}),
               exRenderFailure);
  EXPECT_THROW(Provider.render(stuRenderRequest{enuRenderSource::SnapshotFile,
                                                "/nonexistent/page.json", {}}),
               exRenderFailure);
}

TEST(JsonLayoutProviderTest, RenderConfigDefaults) {
  stuRenderConfig Config;
  EXPECT_EQ(Config.ViewportWidth, 1280u);
  EXPECT_EQ(Config.ViewportHeight, 800u);
  EXPECT_EQ(Config.WaitStrategy, enuWaitStrategy::NetworkIdle);
  EXPECT_EQ(Config.TimeoutMs, 30000u);
}

TEST(LayoutProviderTest, RenderFailuresPropagateUnchanged) {
  clsFailingProvider Provider;
  clsSectLa SectLa;
  try {
    SectLa.detectSections(Provider, stuRenderRequest{enuRenderSource::Url,
                                                     "https://slow.example/",
                                                     {}});
    FAIL() << "render failure was swallowed";
  } catch (const exRenderFailure& _exp) {
    EXPECT_EQ(std::string(_exp.what()),
              "Render failure: navigation to `https://slow.example/` timed out");
  }
}

TEST(LayoutProviderTest, DetectsSectionsOfRenderedPages) {
  clsFixedProvider Provider;
  clsSectLa SectLa;
  stuRenderRequest Request{enuRenderSource::Url, "https://example.com/", {}};
  Request.Config.ViewportWidth = 1440;

  auto Sections = SectLa.detectSections(Provider, Request);
  EXPECT_EQ(Provider.LastRequest.Config.ViewportWidth, 1440u);
  ASSERT_EQ(Sections.size(), 2u);
  EXPECT_EQ(Sections[0].Type, enuSectionType::Header);
}

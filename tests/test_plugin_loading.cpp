#include <gtest/gtest.h>

#include <fstream>
#include <memory>
#include <string>
#include <vector>

#include "kernel/dispatcher.hpp"
#include "kernel/plugin_manager.hpp"
#include "kernel/provider_manifest.hpp"
#include "plugin_loader.hpp"
#include "thumbnail/thumbnail_renderer.hpp"

// Set by the build: directory holding the fixture libraries, and the full
// path of the fixture plugin itself, plus two libraries kept outside it.
#ifndef THUMBKIT_TEST_PLUGIN_DIR
#error "THUMBKIT_TEST_PLUGIN_DIR must be defined"
#endif
#ifndef THUMBKIT_FIXTURE_PLUGIN_PATH
#error "THUMBKIT_FIXTURE_PLUGIN_PATH must be defined"
#endif
#if !defined(THUMBKIT_NONSTANDARD_THROW_PLUGIN_PATH) || !defined(THUMBKIT_TEXT_PREVIEW_PLUGIN_PATH)
#error "THUMBKIT_NONSTANDARD_THROW_PLUGIN_PATH and THUMBKIT_TEXT_PREVIEW_PLUGIN_PATH must be defined"
#endif

namespace fs = std::filesystem;
using tk::DiscoveryReport;
using tk::Dispatcher;
using tk::PluginManager;
using tk::ProviderRegistry;
using tk::RenderRequest;
using tk::ThumbnailRenderer;

namespace {

class PluginLoadingTest : public ::testing::Test {
 protected:
  void SetUp() override {
    const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
    work_dir_ = fs::temp_directory_path() / (std::string("thumbkit_plugins_") + info->name());
    fs::remove_all(work_dir_);
    fs::create_directories(work_dir_);
  }
  void TearDown() override {
    std::error_code ec;
    fs::remove_all(work_dir_, ec);
  }

  fs::path write_file(const std::string& name, const std::string& text) {
    fs::path p = work_dir_ / name;
    std::ofstream(p) << text;
    return p;
  }

  fs::path work_dir_;
};

std::vector<std::string> names_of(const ProviderRegistry& registry) {
  std::vector<std::string> names;
  for (const auto& info : registry.list(ThumbnailRenderer::capability_name())) names.push_back(info.name);
  return names;
}

}  // namespace

TEST_F(PluginLoadingTest, LoadsDirectoryAndReportsBrokenLibraries) {
  ProviderRegistry registry;
  auto result = tk::load_plugins({THUMBKIT_TEST_PLUGIN_DIR}, registry);

  // fixture_plugin loads; not_a_plugin lacks the export; throwing_plugin throws.
  EXPECT_EQ(result.attempted, 3);
  EXPECT_EQ(result.loaded, 1);
  ASSERT_EQ(result.errors.size(), 2u);
  bool saw_missing_symbol = false, saw_exception = false;
  for (const auto& e : result.errors) {
    if (e.code == tk::ThumbErrc::MissingSymbol) saw_missing_symbol = true;
    if (e.message == "plugin registration aborted") saw_exception = true;
  }
  EXPECT_TRUE(saw_missing_symbol);
  EXPECT_TRUE(saw_exception);

  // Nothing from the plugin that threw mid-registration survives.
  EXPECT_EQ(names_of(registry), (std::vector<std::string>{"fixture_reject", "fixture_broken", "fixture_accept"}));
  EXPECT_EQ(result.new_provider_keys,
            (std::vector<std::string>{"thumbnail_renderer:fixture_reject", "thumbnail_renderer:fixture_broken",
                                      "thumbnail_renderer:fixture_accept"}));
  for (const auto& info : registry.list()) {
    EXPECT_EQ(info.source, fs::absolute(THUMBKIT_FIXTURE_PLUGIN_PATH).string());
  }
}

TEST_F(PluginLoadingTest, MissingDirectoryIsNotAnError) {
  ProviderRegistry registry;
  auto result = tk::load_plugins({(work_dir_ / "nope").string(), "", (work_dir_ / "nope/**").string()}, registry);
  EXPECT_EQ(result.attempted, 0);
  EXPECT_TRUE(result.errors.empty());
  EXPECT_TRUE(registry.list().empty());
}

TEST_F(PluginLoadingTest, RecursivePatternFindsNestedPlugins) {
  fs::path nested = work_dir_ / "a" / "b";
  fs::create_directories(nested);
  fs::copy_file(THUMBKIT_FIXTURE_PLUGIN_PATH, nested / fs::path(THUMBKIT_FIXTURE_PLUGIN_PATH).filename());
  write_file("a/readme.txt", "not a library");

  ProviderRegistry shallow;
  EXPECT_EQ(tk::load_plugins({(work_dir_ / "a").string()}, shallow).attempted, 0);

  ProviderRegistry deep;
  auto result = tk::load_plugins({(work_dir_ / "a/**").string()}, deep);
  EXPECT_EQ(result.loaded, 1);
  EXPECT_EQ(deep.count(ThumbnailRenderer::capability_name()), 3u);
}

TEST_F(PluginLoadingTest, PluginProvidersFlowThroughDispatch) {
  ProviderRegistry registry;
  tk::load_plugins({THUMBKIT_TEST_PLUGIN_DIR}, registry);

  Dispatcher<ThumbnailRenderer> dispatcher(registry);
  DiscoveryReport report;
  auto request = RenderRequest::for_file("sample.FIXTURE", 16, 16);
  auto thumb = dispatcher.handle(request, &report);
  ASSERT_TRUE(thumb.has_value());
  EXPECT_EQ(thumb->renderer, "fixture_accept");
  EXPECT_EQ(thumb->source_width, 40);
  EXPECT_EQ(thumb->image.width, 16);
  EXPECT_EQ(thumb->image.height, 8);
  ASSERT_EQ(report.skipped.size(), 1u);
  EXPECT_EQ(report.skipped[0].info().name, "fixture_broken");
  EXPECT_EQ(report.skipped[0].cause(), "codec library not installed");
  EXPECT_EQ(report.rejected, 1);
}

TEST_F(PluginLoadingTest, ProvidersOutliveUnload) {
  ProviderRegistry registry;
  PluginManager manager(registry);
  manager.load_from_dirs({THUMBKIT_TEST_PLUGIN_DIR});
  registry.register_provider<ThumbnailRenderer>("builtin_dummy", [] { return std::shared_ptr<ThumbnailRenderer>(); });

  Dispatcher<ThumbnailRenderer> dispatcher(registry);
  auto request = RenderRequest::for_file("x.fixture", 64, 64);
  auto provider = dispatcher.find_provider(request);
  ASSERT_NE(provider, nullptr);

  auto sources = manager.provider_sources();
  EXPECT_EQ(sources.at("thumbnail_renderer:builtin_dummy"), tk::kBuiltinSource);
  EXPECT_EQ(sources.at("thumbnail_renderer:fixture_accept"), fs::absolute(THUMBKIT_FIXTURE_PLUGIN_PATH).string());

  EXPECT_EQ(manager.unload_all_plugins(), 3);
  EXPECT_EQ(names_of(registry), (std::vector<std::string>{"builtin_dummy"}));
  EXPECT_EQ(dispatcher.find_provider(request), nullptr);

  // The instance handed out before the unload still works.
  auto thumb = dispatcher.dispatch(*provider, request);
  EXPECT_EQ(thumb.renderer, "fixture_accept");
}

TEST_F(PluginLoadingTest, UnloadByPathLeavesBuiltinsAlone) {
  ProviderRegistry registry;
  PluginManager manager(registry);
  registry.register_provider<ThumbnailRenderer>("builtin_dummy", [] { return std::shared_ptr<ThumbnailRenderer>(); });
  manager.load_from_dirs({THUMBKIT_TEST_PLUGIN_DIR});

  EXPECT_EQ(manager.unload_by_plugin_path(tk::kBuiltinSource), 0);
  EXPECT_EQ(manager.unload_by_plugin_path(fs::absolute(THUMBKIT_FIXTURE_PLUGIN_PATH).string()), 3);
  EXPECT_EQ(names_of(registry), (std::vector<std::string>{"builtin_dummy"}));
}

TEST_F(PluginLoadingTest, ManifestEntriesAreRealizedLazily) {
  const std::string plugin = fs::absolute(THUMBKIT_FIXTURE_PLUGIN_PATH).string();
  fs::path manifest = write_file("providers.yaml",
      "providers:\n"
      "  - capability: thumbnail_renderer\n"
      "    name: missing_library\n"
      "    library: does/not/exist.so\n"
      "    factory: create_fixture_renderer\n"
      "  - capability: thumbnail_renderer\n"
      "    name: missing_symbol\n"
      "    library: " + plugin + "\n"
      "    factory: create_nothing\n"
      "  - capability: thumbnail_renderer\n"
      "    name: null_instance\n"
      "    library: " + plugin + "\n"
      "    factory: create_null_renderer\n"
      "  - capability: thumbnail_renderer\n"
      "    name: from_manifest\n"
      "    library: " + plugin + "\n"
      "    factory: create_fixture_renderer\n"
      "  - capability: audio_transcoder\n"
      "    name: other_capability\n"
      "    library: whatever.so\n"
      "    factory: create\n");

  ProviderRegistry registry;
  PluginManager manager(registry);
  auto result = manager.load_manifest<ThumbnailRenderer>(manifest);
  EXPECT_TRUE(result.errors.empty());
  EXPECT_EQ(result.loaded, 1);
  EXPECT_EQ(names_of(registry),
            (std::vector<std::string>{"missing_library", "missing_symbol", "null_instance", "from_manifest"}));
  EXPECT_EQ(registry.count("audio_transcoder"), 0u);

  DiscoveryReport report;
  Dispatcher<ThumbnailRenderer> dispatcher(registry);
  auto provider = dispatcher.find_provider(RenderRequest::for_file("a.fixture", 32, 32), &report);
  ASSERT_NE(provider, nullptr);
  EXPECT_EQ(report.selected, "from_manifest");
  ASSERT_EQ(report.skipped.size(), 3u);
  EXPECT_EQ(report.skipped[0].info().name, "missing_library");
  EXPECT_EQ(report.skipped[1].info().name, "missing_symbol");
  EXPECT_EQ(report.skipped[2].info().name, "null_instance");
  EXPECT_EQ(report.skipped[2].cause(), "factory returned no instance");
  EXPECT_EQ(report.skipped[0].info().source, fs::absolute(manifest).string());
}

TEST_F(PluginLoadingTest, ManifestLibraryPathsAreRelativeToTheManifest) {
  fs::path libdir = work_dir_ / "libs";
  fs::create_directories(libdir);
  const fs::path lib_name = fs::path(THUMBKIT_FIXTURE_PLUGIN_PATH).filename();
  fs::copy_file(THUMBKIT_FIXTURE_PLUGIN_PATH, libdir / lib_name);
  fs::path manifest = write_file("relative.yaml",
      "providers:\n"
      "  - capability: thumbnail_renderer\n"
      "    name: relative\n"
      "    library: libs/" + lib_name.string() + "\n"
      "    factory: create_fixture_renderer\n");

  auto parsed = tk::read_provider_manifest(manifest);
  ASSERT_EQ(parsed.entries.size(), 1u);
  EXPECT_EQ(parsed.entries[0].library.string(), (fs::absolute(manifest).parent_path() / "libs" / lib_name).string());
  EXPECT_EQ(parsed.entries[0].line, 2);

  ProviderRegistry registry;
  tk::register_manifest<ThumbnailRenderer>(registry, manifest);
  auto seq = registry.load<ThumbnailRenderer>();
  auto renderer = seq.next();
  EXPECT_EQ(renderer->description(), "fixture files");
}

TEST_F(PluginLoadingTest, BadManifestsAreReported) {
  ProviderRegistry registry;

  auto missing = tk::register_manifest<ThumbnailRenderer>(registry, work_dir_ / "absent.yaml");
  ASSERT_EQ(missing.errors.size(), 1u);
  EXPECT_EQ(missing.errors[0].code, tk::ThumbErrc::NotFound);

  auto malformed = tk::register_manifest<ThumbnailRenderer>(registry, write_file("bad.yaml", "providers: [unclosed\n"));
  ASSERT_EQ(malformed.errors.size(), 1u);
  EXPECT_EQ(malformed.errors[0].code, tk::ThumbErrc::InvalidYaml);

  auto no_list = tk::register_manifest<ThumbnailRenderer>(registry, write_file("empty.yaml", "name: x\n"));
  ASSERT_EQ(no_list.errors.size(), 1u);
  EXPECT_EQ(no_list.errors[0].code, tk::ThumbErrc::InvalidYaml);

  auto no_capability = tk::register_manifest<ThumbnailRenderer>(registry,
      write_file("nocap.yaml", "providers:\n  - name: orphan\n    library: x.so\n    factory: f\n"));
  ASSERT_EQ(no_capability.errors.size(), 1u);
  EXPECT_EQ(no_capability.errors[0].code, tk::ThumbErrc::InvalidParameter);

  EXPECT_TRUE(registry.list().empty());
}

TEST_F(PluginLoadingTest, NonStandardThrowDuringRegistrationIsReported) {
  fs::path dir = work_dir_ / "mixed";
  fs::create_directories(dir);
  const fs::path thrower = dir / fs::path(THUMBKIT_NONSTANDARD_THROW_PLUGIN_PATH).filename();
  fs::copy_file(THUMBKIT_NONSTANDARD_THROW_PLUGIN_PATH, thrower);
  fs::copy_file(THUMBKIT_FIXTURE_PLUGIN_PATH, dir / fs::path(THUMBKIT_FIXTURE_PLUGIN_PATH).filename());

  ProviderRegistry registry;
  auto result = tk::load_plugins({dir.string()}, registry);
  EXPECT_EQ(result.attempted, 2);
  EXPECT_EQ(result.loaded, 1);
  ASSERT_EQ(result.errors.size(), 1u);
  EXPECT_EQ(result.errors[0].path, fs::absolute(thrower).string());
  EXPECT_EQ(result.errors[0].code, tk::ThumbErrc::Unknown);
  EXPECT_EQ(result.errors[0].message, "non-standard exception during registration");
  EXPECT_EQ(names_of(registry), (std::vector<std::string>{"fixture_reject", "fixture_broken", "fixture_accept"}));
}

TEST_F(PluginLoadingTest, TextPreviewPluginRendersTextFiles) {
  ProviderRegistry registry;
  auto result = tk::load_plugin_file(THUMBKIT_TEXT_PREVIEW_PLUGIN_PATH, registry);
  ASSERT_TRUE(result.errors.empty()) << result.errors[0].message;
  EXPECT_EQ(result.new_provider_keys, (std::vector<std::string>{"thumbnail_renderer:text_preview"}));

  fs::path notes = write_file("Notes.TXT", "first line\n\tindented\nthird\n");
  Dispatcher<ThumbnailRenderer> dispatcher(registry);
  EXPECT_EQ(dispatcher.find_provider(RenderRequest::for_file(work_dir_ / "photo.png", 64, 64)), nullptr);

  DiscoveryReport report;
  auto thumb = dispatcher.handle(RenderRequest::for_file(notes, 64, 48), &report);
  ASSERT_TRUE(thumb.has_value());
  EXPECT_EQ(report.selected, "text_preview");
  EXPECT_EQ(thumb->renderer, "text_preview");
  EXPECT_EQ(thumb->source_width, 512);
  EXPECT_EQ(thumb->source_height, 512);
  EXPECT_EQ(thumb->image.width, 48);
  EXPECT_EQ(thumb->image.height, 48);
  EXPECT_EQ(thumb->image.channels, 3);
}

TEST_F(PluginLoadingTest, TextPreviewPluginReportsUnreadableFile) {
  ProviderRegistry registry;
  tk::load_plugin_file(THUMBKIT_TEXT_PREVIEW_PLUGIN_PATH, registry);
  Dispatcher<ThumbnailRenderer> dispatcher(registry);
  try {
    dispatcher.handle(RenderRequest::for_file(work_dir_ / "missing.md", 32, 32));
    FAIL() << "expected ProviderProcessingError";
  } catch (const tk::ProviderProcessingError& e) {
    EXPECT_EQ(e.code(), tk::ThumbErrc::Io);
  }
}

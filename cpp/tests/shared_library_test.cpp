#include <gtest/gtest.h>
#include "native/shared_library.hpp"
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace {

using GetNumFeaturesFn = int (*)();

const char* kMissing = "/nonexistent/libdg_go.so";

int features_of(const dg::SharedLibrary& library) {
    return library.symbol<GetNumFeaturesFn>("get_num_features")();
}

} // namespace

TEST(OpenFirstLoadable, ReturnsOnlyLoadableCandidate) {
    dg::SharedLibrary library = dg::open_first_loadable({kMissing, FAKE_DG_GO_PATH});

    EXPECT_EQ(library.path(), FAKE_DG_GO_PATH);
    EXPECT_EQ(features_of(library), 4);
}

TEST(OpenFirstLoadable, PrefersEarlierCandidates) {
    dg::SharedLibrary alt = dg::open_first_loadable({kMissing, FAKE_DG_GO_ALT_PATH, FAKE_DG_GO_PATH});
    EXPECT_EQ(alt.path(), FAKE_DG_GO_ALT_PATH);
    EXPECT_EQ(features_of(alt), 7);

    dg::SharedLibrary fake = dg::open_first_loadable({FAKE_DG_GO_PATH, FAKE_DG_GO_ALT_PATH});
    EXPECT_EQ(fake.path(), FAKE_DG_GO_PATH);
    EXPECT_EQ(features_of(fake), 4);
}

TEST(OpenFirstLoadable, ThrowsWhenNothingLoads) {
    const std::vector<std::string> candidates = {kMissing, "/nonexistent/libgo.so"};

    try {
        dg::open_first_loadable(candidates);
        FAIL() << "expected LibraryNotFound";
    } catch (const dg::LibraryNotFound& e) {
        EXPECT_EQ(e.candidates(), candidates);
        const std::string message = e.what();
        EXPECT_NE(message.find(kMissing), std::string::npos);
        EXPECT_NE(message.find("/nonexistent/libgo.so"), std::string::npos);
    }
}

TEST(OpenFirstLoadable, ThrowsOnEmptyCandidateList) {
    EXPECT_THROW(dg::open_first_loadable({}), dg::LibraryNotFound);
}

TEST(OpenFirstLoadable, VerboseLogsEachFailure) {
    testing::internal::CaptureStderr();
    dg::SharedLibrary library = dg::open_first_loadable({kMissing, FAKE_DG_GO_PATH}, true);
    const std::string log = testing::internal::GetCapturedStderr();

    EXPECT_NE(log.find(std::string("failed to load ") + kMissing), std::string::npos);
    EXPECT_NE(log.find(std::string("loaded ") + FAKE_DG_GO_PATH), std::string::npos);
}

TEST(OpenFirstLoadable, QuietByDefault) {
    testing::internal::CaptureStderr();
    dg::SharedLibrary library = dg::open_first_loadable({kMissing, FAKE_DG_GO_PATH});
    EXPECT_EQ(testing::internal::GetCapturedStderr(), "");
}

TEST(SharedLibrary, MissingSymbolThrows) {
    dg::SharedLibrary library = dg::open_first_loadable({FAKE_DG_GO_PATH});
    EXPECT_THROW(library.symbol<GetNumFeaturesFn>("no_such_function"), std::runtime_error);
}

TEST(SharedLibrary, MoveTransfersHandle) {
    dg::SharedLibrary first = dg::open_first_loadable({FAKE_DG_GO_PATH});
    dg::SharedLibrary second = std::move(first);

    EXPECT_EQ(features_of(second), 4);
    EXPECT_THROW(first.symbol<GetNumFeaturesFn>("get_num_features"), std::runtime_error);
}

TEST(LoadOrExitDeathTest, ExitsWhenNothingLoads) {
    EXPECT_EXIT(dg::load_or_exit({kMissing}),
                ::testing::ExitedWithCode(1),
                "Failed to load the shared library");
}

TEST(LoadOrExitDeathTest, FatalMessageNamesEveryCandidate) {
    EXPECT_EXIT(dg::load_or_exit({"/nonexistent/custom_go.so", "/nonexistent/other_go.so"}),
                ::testing::ExitedWithCode(1),
                "/nonexistent/custom_go.so: .*/nonexistent/other_go.so: ");
}

TEST(LoadOrExit, ReturnsFirstLoadable) {
    dg::SharedLibrary library = dg::load_or_exit({kMissing, FAKE_DG_GO_ALT_PATH});
    EXPECT_EQ(features_of(library), 7);
}

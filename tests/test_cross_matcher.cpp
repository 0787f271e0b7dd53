#include <gtest/gtest.h>

#include "core/common/TimeUtil.hpp"
#include "core/match/CrossMatcher.hpp"
#include "TestSupport.hpp"

using namespace sdi;
using nlohmann::json;

namespace {

json at(json attrs, const std::string& path) {
  attrs["path"] = path;
  return attrs;
}

const std::string kNav = "/survey/em710_241/nav/sbet_Mission_1.out";
const std::string kErr = "/survey/em710_241/nav/smrmsg_Mission_1.out";
const std::string kLog = "/survey/em710_241/nav/export_Mission_1.txt";

class CrossMatcherTest : public ::testing::Test {
protected:
  void addNavTriple(double start, double end) {
    ASSERT_TRUE(nav.addRecord(at(fixtures::weeklyAttrs("POSPac sbet", start - 0.5, end - 0.2, 900.0), kNav)));
    ASSERT_TRUE(errors.addRecord(at(fixtures::weeklyAttrs("POSPac smrmsg", start, end, 300.0), kErr)));
    ASSERT_TRUE(logs.addRecord(at(fixtures::exportLogAttrs("D:\\export\\sbet_Mission_1.out"), kLog)));
    matcher.matchNavErrorToNav(errors, nav);
    matcher.matchExportLogToNav(logs, nav);
  }

  CrossMatcher matcher;
  MultibeamStore mbes;
  NavigationStore nav;
  NavErrorStore errors;
  NavExportLogStore logs;
  SvpStore svp;
};

} // namespace

TEST(CrossMatcherNames, NewContainerName) {
  MultibeamRecord r;
  r.sonarModel = "em710";
  r.primarySerial = 241;
  r.dataStartUtc = fixtures::kLineStart;
  EXPECT_EQ(newContainerName(r), "em710_241_03_17_2020");
}

TEST_F(CrossMatcherTest, MultibeamWithoutProjectGetsNewContainer) {
  ASSERT_TRUE(mbes.addRecord(at(fixtures::kmallAttrs(), "/survey/0001_line.kmall")));
  matcher.matchMultibeamToProject(mbes, nullptr);

  ASSERT_EQ(mbes.lineGroups().count("em710_241_03_17_2020"), 1u);
  EXPECT_EQ(mbes.lineGroups().at("em710_241_03_17_2020"), std::vector<std::string>{"/survey/0001_line.kmall"});
  EXPECT_EQ(mbes.matchingFqpr().at("/survey/0001_line.kmall"), "");
  EXPECT_NE(mbes.unmatchedFiles().at("/survey/0001_line.kmall").find("No project"), std::string::npos);
}

TEST_F(CrossMatcherTest, MultibeamMatchesExistingContainerBySerialAndDay) {
  fixtures::FakeProject project;
  project.add(fixtures::instanceRecord("em710_241_03_17_2020"));
  ASSERT_TRUE(mbes.addRecord(at(fixtures::kmallAttrs(241, fixtures::kLineStart + 3600.0), "/survey/0002_line.kmall")));
  ASSERT_TRUE(mbes.addRecord(at(fixtures::kmallAttrs(999, fixtures::kLineStart, 55.0), "/survey/0003_line.kmall")));

  matcher.matchMultibeamToProject(mbes, &project);
  EXPECT_EQ(mbes.matchingFqpr().at("/survey/0002_line.kmall"), "em710_241_03_17_2020");
  EXPECT_EQ(mbes.lineGroups().at("em710_241_03_17_2020"), std::vector<std::string>{"/survey/0002_line.kmall"});
  EXPECT_EQ(mbes.unmatchedFiles().count("/survey/0002_line.kmall"), 0u);
  EXPECT_EQ(mbes.lineGroups().count("em710_999_03_17_2020"), 1u);
  EXPECT_EQ(mbes.unmatchedFiles().count("/survey/0003_line.kmall"), 1u);
}

TEST_F(CrossMatcherTest, ConvertedLineIsNotGroupedAgain) {
  fixtures::FakeProject project;
  auto r = fixtures::instanceRecord("em710_241_03_17_2020");
  r.multibeamFiles = {"0001_line.kmall"};
  project.add(r);
  ASSERT_TRUE(mbes.addRecord(at(fixtures::kmallAttrs(), "/survey/0001_line.kmall")));

  matcher.matchMultibeamToProject(mbes, &project);
  EXPECT_TRUE(mbes.lineGroups().empty());
  EXPECT_EQ(mbes.matchingFqpr().at("/survey/0001_line.kmall"), "em710_241_03_17_2020");
}

TEST_F(CrossMatcherTest, ErrorFileMatchesNavigationWithinTolerance) {
  ASSERT_TRUE(nav.addRecord(at(fixtures::weeklyAttrs("POSPac sbet", 210773.5, 212846.8, 900.0), kNav)));
  ASSERT_TRUE(errors.addRecord(at(fixtures::weeklyAttrs("POSPac smrmsg", 210774.0, 212847.0, 300.0), kErr)));

  matcher.matchNavErrorToNav(errors, nav);
  EXPECT_EQ(errors.matchingSbet().at(kErr), kNav);
  EXPECT_EQ(errors.sbetLookup().at(kNav), kErr);
  EXPECT_TRUE(errors.unmatchedFiles().empty());
}

TEST_F(CrossMatcherTest, RematchingIsIdempotent) {
  addNavTriple(210774.0, 212847.0);
  const auto links = errors.matchingSbet();
  const auto logLinks = logs.matchingSbet();
  matcher.matchNavErrorToNav(errors, nav);
  matcher.matchExportLogToNav(logs, nav);
  EXPECT_EQ(errors.matchingSbet(), links);
  EXPECT_EQ(logs.matchingSbet(), logLinks);
  EXPECT_EQ(logs.matchingSbet().at(kLog), kNav);
}

TEST_F(CrossMatcherTest, SecondErrorFileForSameNavigationIsUnmatched) {
  ASSERT_TRUE(nav.addRecord(at(fixtures::weeklyAttrs("POSPac sbet", 100.0, 200.0, 900.0), kNav)));
  ASSERT_TRUE(errors.addRecord(at(fixtures::weeklyAttrs("POSPac smrmsg", 100.0, 200.0, 300.0), kErr)));
  const std::string copy = "/survey/em710_241/nav/smrmsg_Mission_1_copy.out";
  ASSERT_TRUE(errors.addRecord(at(fixtures::weeklyAttrs("POSPac smrmsg", 100.0, 200.0, 301.0), copy)));

  matcher.matchNavErrorToNav(errors, nav);
  EXPECT_EQ(errors.matchingSbet().at(kErr), kNav);
  EXPECT_EQ(errors.matchingSbet().count(copy), 0u);
  EXPECT_NE(errors.unmatchedFiles().at(copy).find("already paired"), std::string::npos);
}

TEST_F(CrossMatcherTest, ErrorFileWithoutNavigationIsUnmatched) {
  ASSERT_TRUE(errors.addRecord(at(fixtures::weeklyAttrs("POSPac smrmsg", 100.0, 200.0, 300.0), kErr)));
  matcher.matchNavErrorToNav(errors, nav);
  EXPECT_TRUE(errors.matchingSbet().empty());
  EXPECT_FALSE(errors.unmatchedFiles().at(kErr).empty());
}

TEST_F(CrossMatcherTest, NavigationWithoutDependenciesNamesBoth) {
  ASSERT_TRUE(nav.addRecord(at(fixtures::weeklyAttrs("POSPac sbet", 100.0, 200.0, 900.0), kNav)));
  matcher.matchNavErrorToNav(errors, nav);
  matcher.matchExportLogToNav(logs, nav);

  fixtures::FakeProject project;
  project.add(fixtures::instanceRecord("em710_241_03_17_2020"));
  matcher.matchNavToProject(nav, errors, logs, &project);

  const std::string reason = nav.unmatchedFiles().at(kNav);
  EXPECT_NE(reason.find("error"), std::string::npos);
  EXPECT_NE(reason.find("export log"), std::string::npos);
  EXPECT_TRUE(nav.navGroups().empty());
}

TEST_F(CrossMatcherTest, NavigationVotesForContainer) {
  const double weekly = timeutil::weeklySeconds(fixtures::kLineStart);
  addNavTriple(weekly + 100.0, weekly + 4000.0);

  fixtures::FakeProject project;
  project.add(fixtures::instanceRecord("em710_241_03_17_2020"));
  auto other = fixtures::instanceRecord("em2040_100_03_01_2020", 100, fixtures::kLineStart - 16 * 86400.0);
  other.model = "em2040";
  project.add(other);

  matcher.matchNavToProject(nav, errors, logs, &project);
  ASSERT_EQ(nav.navGroups().count("em710_241_03_17_2020"), 1u);
  EXPECT_EQ(nav.navGroups().at("em710_241_03_17_2020"), std::vector<std::string>{kNav});
  EXPECT_EQ(nav.matchingFqpr().at(kNav), "em710_241_03_17_2020");
  EXPECT_EQ(nav.unmatchedFiles().count(kNav), 0u);
}

TEST_F(CrossMatcherTest, ImportedNavigationIsNotGrouped) {
  const double weekly = timeutil::weeklySeconds(fixtures::kLineStart);
  addNavTriple(weekly + 100.0, weekly + 4000.0);

  fixtures::FakeProject project;
  auto r = fixtures::instanceRecord("em710_241_03_17_2020");
  r.navigationFiles = {"sbet_Mission_1.out"};
  project.add(r);

  matcher.matchNavToProject(nav, errors, logs, &project);
  EXPECT_TRUE(nav.navGroups().empty());
  EXPECT_NE(nav.unmatchedFiles().at(kNav).find("already imported into em710_241_03_17_2020"), std::string::npos);
}

TEST_F(CrossMatcherTest, SvpGroupsOnlyWhereCastsAreNew) {
  const double cast = fixtures::kLineStart - 600.0;
  fixtures::FakeProject project;
  auto known = fixtures::instanceRecord("em710_241_03_17_2020");
  known.castTimes = {cast};
  project.add(known);
  project.add(fixtures::instanceRecord("em710_241_03_18_2020", 241, fixtures::kLineStart + 86400.0));

  // sub second difference is the same cast
  ASSERT_TRUE(svp.addRecord(at(fixtures::svpAttrs({cast + 0.3}), "/svp/cast1.svp")));
  matcher.matchSvpToProject(svp, &project);

  EXPECT_EQ(svp.svpGroups().count("em710_241_03_17_2020"), 0u);
  EXPECT_EQ(svp.svpGroups().at("em710_241_03_18_2020"), std::vector<std::string>{"/svp/cast1.svp"});
  EXPECT_EQ(svp.matchingFqpr().at("/svp/cast1.svp"), std::vector<std::string>{"em710_241_03_18_2020"});
}

TEST_F(CrossMatcherTest, SvpWithoutProjectIsUnmatched) {
  ASSERT_TRUE(svp.addRecord(at(fixtures::svpAttrs({fixtures::kLineStart}), "/svp/cast1.svp")));
  matcher.matchSvpToProject(svp, nullptr);
  EXPECT_TRUE(svp.svpGroups().empty());
  EXPECT_FALSE(svp.unmatchedFiles().at("/svp/cast1.svp").empty());
}

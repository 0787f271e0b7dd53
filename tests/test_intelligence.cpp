#include <gtest/gtest.h>
#include <stdexcept>

#include "core/actions/CatalogEngine.hpp"
#include "core/common/TimeUtil.hpp"
#include "core/intel/Intelligence.hpp"
#include "TestSupport.hpp"

using namespace sdi;

namespace {

const std::string kKey = "em710_241_03_17_2020";
const std::string kLine1 = "/survey/em710_241/0001_line.kmall";
const std::string kLine2 = "/survey/em710_241/0002_line.kmall";
const std::string kNav = "/survey/em710_241/nav/sbet_Mission_1.out";
const std::string kErr = "/survey/em710_241/nav/smrmsg_Mission_1.out";
const std::string kLog = "/survey/em710_241/nav/export_Mission_1.txt";
const std::string kSvp = "/survey/svp/cast1.svp";

class IntelligenceTest : public ::testing::Test {
protected:
  IntelligenceTest()
    : gatherer(std::make_shared<fixtures::FakeGatherer>()),
      project(std::make_shared<fixtures::FakeProject>()),
      intel(gatherer) {
    const double weekly = timeutil::weeklySeconds(fixtures::kLineStart);
    gatherer->set(kLine1, fixtures::kmallAttrs(241, fixtures::kLineStart, 100.0));
    gatherer->set(kLine2, fixtures::kmallAttrs(241, fixtures::kLineStart + 900.0, 120.0));
    gatherer->set(kNav, fixtures::weeklyAttrs("POSPac sbet", weekly + 99.5, weekly + 3999.8, 900.0),
                  NavFormat::Navigation);
    gatherer->set(kErr, fixtures::weeklyAttrs("POSPac smrmsg", weekly + 100.0, weekly + 4000.0, 300.0),
                  NavFormat::NavError);
    gatherer->set(kLog, fixtures::exportLogAttrs("D:\\export\\sbet_Mission_1.out"));
    gatherer->set(kSvp, fixtures::svpAttrs({fixtures::kLineStart - 600.0}));
    intel.bindToActionUpdate([this]() { ++notifications; });
  }

  void useProject() {
    intel.setProject(project);
    intel.setActionEngine(makeCatalogEngine(project, gatherer));
  }

  std::shared_ptr<fixtures::FakeGatherer> gatherer;
  std::shared_ptr<fixtures::FakeProject> project;
  Intelligence intel;
  int notifications = 0;
};

} // namespace

TEST_F(IntelligenceTest, UniqueIdsIncrease) {
  const auto a = intel.addFile(kLine1);
  const auto dup = intel.addFile(kLine1);
  const auto b = intel.addFile(kSvp);
  EXPECT_EQ(a.status, IngestStatus::Added);
  EXPECT_EQ(dup.status, IngestStatus::Duplicate);
  EXPECT_FALSE(dup.uniqueId.has_value());
  ASSERT_TRUE(a.uniqueId && b.uniqueId);
  EXPECT_LT(*a.uniqueId, *b.uniqueId);
  EXPECT_EQ(b.category, FileCategory::Svp);
}

TEST_F(IntelligenceTest, UnsupportedFilesAreReported) {
  EXPECT_EQ(intel.addFile("/survey/readme.pdf").status, IngestStatus::Unsupported);
  gatherer->set("/survey/nav/garbage.out", nlohmann::json::object(), NavFormat::Neither);
  EXPECT_EQ(intel.addFile("/survey/nav/garbage.out").status, IngestStatus::Unsupported);
  EXPECT_THROW(intel.addFile("/survey/missing.kmall"), CorruptSourceFile);
  EXPECT_EQ(intel.multibeam().size(), 0u);
}

TEST_F(IntelligenceTest, LineWithoutProjectQueuesConversion) {
  intel.addFile(kLine1);
  ASSERT_EQ(intel.multibeam().lineGroups().count(kKey), 1u);
  const Action* convert = intel.actions().find(ActionType::Convert, kKey);
  ASSERT_NE(convert, nullptr);
  EXPECT_EQ(convert->inputFiles, std::vector<std::string>{kLine1});
  EXPECT_EQ(intel.unmatchedFiles().count(kLine1), 1u);
}

TEST_F(IntelligenceTest, RemovingLastLineDropsGroupAndAction) {
  intel.addFile(kLine1);
  const auto removed = intel.removeFile(kLine1);
  EXPECT_EQ(removed.status, IngestStatus::Removed);
  EXPECT_EQ(removed.category, FileCategory::Multibeam);
  EXPECT_EQ(intel.multibeam().lineGroups().count(kKey), 0u);
  EXPECT_EQ(intel.actions().find(ActionType::Convert, kKey), nullptr);
  EXPECT_TRUE(intel.unmatchedFiles().empty());
  EXPECT_EQ(intel.removeFile(kLine1).status, IngestStatus::NotFound);
}

TEST_F(IntelligenceTest, UnchangedAssociationsDoNotNotify) {
  intel.addFile(kLine1);
  EXPECT_EQ(notifications, 1);
  // no project, the cast cannot be grouped, nothing to regenerate
  intel.addFile(kSvp);
  EXPECT_EQ(notifications, 1);
  intel.addFile(kLine2);
  EXPECT_EQ(notifications, 2);
  EXPECT_EQ(intel.actions().find(ActionType::Convert, kKey)->inputFiles.size(), 2u);
  intel.removeFile(kSvp);
  EXPECT_EQ(notifications, 2);
}

TEST_F(IntelligenceTest, ExecuteNeedsProject) {
  intel.addFile(kLine1);
  EXPECT_THROW(intel.executeAction(0), std::runtime_error);
  EXPECT_EQ(intel.actions().size(), 1u);
}

TEST_F(IntelligenceTest, ConvertThenImportCasts) {
  useProject();
  intel.addFile(kLine1);
  intel.addFile(kSvp);
  // no container yet, the cast waits for one
  EXPECT_EQ(intel.unmatchedFiles().count(kSvp), 1u);

  auto instance = intel.executeAction(0);
  ASSERT_TRUE(instance);
  EXPECT_EQ(project->stores, 1);
  EXPECT_EQ(project->instances().count(kKey), 1u);
  EXPECT_EQ(intel.actions().find(ActionType::Convert, kKey), nullptr);
  EXPECT_EQ(intel.multibeam().matchingFqpr().at(kLine1), kKey);

  ASSERT_EQ(intel.actions().size(), 2u);
  EXPECT_EQ(intel.actions().actions()[0].type, ActionType::Svp);
  EXPECT_EQ(intel.actions().actions()[1].type, ActionType::Processing);
  EXPECT_EQ(intel.actions().actions()[1].step, ProcessingStep::Orientation);

  intel.executeAction(0);
  EXPECT_EQ(project->instances().at(kKey)->castTimes().size(), 1u);
  EXPECT_EQ(intel.actions().find(ActionType::Svp, kKey), nullptr);
  EXPECT_NE(intel.unmatchedFiles().at(kSvp).find("already exists"), std::string::npos);

  intel.executeAction(0);
  EXPECT_TRUE(intel.actions().empty());
  EXPECT_EQ(project->instances().at(kKey)->nextRequiredStep(), ProcessingStep::Complete);
}

TEST_F(IntelligenceTest, NavigationNeedsErrorAndLogBeforeImport) {
  project->add(fixtures::instanceRecord(kKey));
  useProject();

  intel.addFile(kNav);
  EXPECT_TRUE(intel.navigation().navGroups().empty());
  EXPECT_EQ(intel.unmatchedFiles().count(kNav), 1u);
  intel.addFile(kErr);
  EXPECT_EQ(intel.navError().matchingSbet().at(kErr), kNav);
  EXPECT_TRUE(intel.navigation().navGroups().empty());
  intel.addFile(kLog);

  const Action* nav = intel.actions().find(ActionType::Navigation, kKey);
  ASSERT_NE(nav, nullptr);
  EXPECT_EQ(nav->inputFiles, std::vector<std::string>{kNav});
  EXPECT_EQ(nav->errorFiles, std::vector<std::string>{kErr});
  EXPECT_EQ(nav->logFiles, std::vector<std::string>{kLog});
  EXPECT_TRUE(intel.unmatchedFiles().empty());

  intel.executeAction(0);
  EXPECT_EQ(intel.actions().find(ActionType::Navigation, kKey), nullptr);
  EXPECT_NE(intel.unmatchedFiles().at(kNav).find("already imported"), std::string::npos);
  const Action* process = intel.actions().find(ActionType::Processing, kKey);
  ASSERT_NE(process, nullptr);
  EXPECT_EQ(process->step, ProcessingStep::Georeference);
}

TEST_F(IntelligenceTest, RemovingErrorFileWithdrawsNavigationAction) {
  project->add(fixtures::instanceRecord(kKey));
  useProject();
  intel.addFile(kNav);
  intel.addFile(kErr);
  intel.addFile(kLog);
  ASSERT_NE(intel.actions().find(ActionType::Navigation, kKey), nullptr);

  intel.removeFile(kErr);
  EXPECT_EQ(intel.actions().find(ActionType::Navigation, kKey), nullptr);
  EXPECT_NE(intel.unmatchedFiles().at(kNav).find("error"), std::string::npos);
}

TEST_F(IntelligenceTest, RegenerateRebuildsFromProject) {
  useProject();
  auto pending = fixtures::instanceRecord(kKey);
  pending.nextStep = ProcessingStep::Tpu;
  project->add(pending);
  EXPECT_EQ(intel.actions().find(ActionType::Processing, kKey), nullptr);

  intel.regenerateActions();
  const Action* process = intel.actions().find(ActionType::Processing, kKey);
  ASSERT_NE(process, nullptr);
  EXPECT_EQ(process->step, ProcessingStep::Tpu);
}

TEST_F(IntelligenceTest, ClearEmptiesEverything) {
  intel.addFile(kLine1);
  intel.addFile(kSvp);
  intel.clear();
  EXPECT_EQ(intel.multibeam().size(), 0u);
  EXPECT_EQ(intel.svp().size(), 0u);
  EXPECT_TRUE(intel.actions().empty());
  EXPECT_TRUE(intel.unmatchedFiles().empty());
  // ids keep counting after a clear
  EXPECT_GT(*intel.addFile(kLine1).uniqueId, 1u);
}

TEST_F(IntelligenceTest, MonitorEventsRouteToStores) {
  fixtures::TempDir dir;
  const std::string line = dir.file("0003_line.kmall");
  const std::string junk = dir.file("0004_line.kmall");
  gatherer->set(line, fixtures::kmallAttrs(241, fixtures::kLineStart + 1800.0, 130.0));

  EXPECT_THROW(intel.startFolderMonitor(dir.file("nope")), std::invalid_argument);
  intel.startFolderMonitor(dir.path().string(), false);
  ASSERT_EQ(intel.monitoredFolders().size(), 1u);

  fixtures::writeBytes(line, "kmall");
  fixtures::writeBytes(junk, "unreadable");
  EXPECT_EQ(intel.pollMonitors(), 2u);
  EXPECT_TRUE(intel.multibeam().contains(line));
  EXPECT_FALSE(intel.multibeam().contains(junk));

  std::filesystem::remove(line);
  EXPECT_EQ(intel.pollMonitors(), 1u);
  EXPECT_FALSE(intel.multibeam().contains(line));

  intel.stopFolderMonitor(dir.path().string());
  EXPECT_TRUE(intel.monitoredFolders().empty());
}

TEST_F(IntelligenceTest, JsonViews) {
  intel.addFile(kLine1);
  const auto files = intel.filesJson();
  ASSERT_EQ(files["multibeam"].size(), 1u);
  EXPECT_EQ(files["multibeam"][0]["path"], kLine1);
  const auto assoc = intel.associationsJson();
  EXPECT_TRUE(assoc.is_object());
}

TEST_F(IntelligenceTest, FailedPersistKeepsActionQueued) {
  useProject();
  intel.addFile(kLine1);
  project->failStores = true;

  EXPECT_THROW(intel.executeAction(0), std::runtime_error);
  const Action* convert = intel.actions().find(ActionType::Convert, kKey);
  ASSERT_NE(convert, nullptr);
  EXPECT_FALSE(convert->isRunning);
  EXPECT_TRUE(project->instances().empty());

  project->failStores = false;
  ASSERT_TRUE(intel.executeAction(0));
  EXPECT_EQ(project->stores, 1);
  EXPECT_EQ(intel.actions().find(ActionType::Convert, kKey), nullptr);
}

TEST_F(IntelligenceTest, FailedEngineKeepsActionQueued) {
  useProject();
  ActionEngine engine = makeCatalogEngine(project, gatherer);
  engine.convert = [](const std::string&, const std::vector<std::string>&, const Settings&) -> InstanceHandle {
    throw std::runtime_error("converter crashed");
  };
  intel.setActionEngine(engine);
  intel.addFile(kLine1);
  intel.addFile(kLine2);

  EXPECT_THROW(intel.executeAction(0), std::runtime_error);
  ASSERT_EQ(intel.actions().size(), 1u);
  const Action& convert = intel.actions().actions()[0];
  EXPECT_EQ(convert.outputDestination, kKey);
  EXPECT_FALSE(convert.isRunning);
  EXPECT_EQ(convert.inputFiles.size(), 2u);
  EXPECT_EQ(project->stores, 0);

  // the queue still follows later changes
  intel.removeFile(kLine2);
  EXPECT_EQ(intel.actions().find(ActionType::Convert, kKey)->inputFiles, std::vector<std::string>{kLine1});
}

TEST_F(IntelligenceTest, UnrelatedErrorFileDoesNotNotify) {
  project->add(fixtures::instanceRecord(kKey));
  useProject();
  intel.addFile(kNav);
  intel.addFile(kErr);
  intel.addFile(kLog);
  ASSERT_NE(intel.actions().find(ActionType::Navigation, kKey), nullptr);
  const int before = notifications;

  const std::string stray = "/other/zz_2021.out";
  gatherer->set(stray, fixtures::weeklyAttrs("POSPac smrmsg", 1000.0, 2000.0, 50.0), NavFormat::NavError);
  EXPECT_EQ(intel.addFile(stray).status, IngestStatus::Added);
  EXPECT_EQ(notifications, before);
  EXPECT_EQ(intel.unmatchedFiles().count(stray), 1u);
  EXPECT_EQ(intel.navError().matchingSbet().count(stray), 0u);

  intel.removeFile(stray);
  EXPECT_EQ(notifications, before);
  EXPECT_NE(intel.actions().find(ActionType::Navigation, kKey), nullptr);
}

TEST_F(IntelligenceTest, RunningActionSurvivesRegenerate) {
  auto pending = fixtures::instanceRecord(kKey);
  pending.nextStep = ProcessingStep::Tpu;
  project->add(pending);
  useProject();
  intel.regenerateActions();
  ASSERT_NE(intel.actions().find(ActionType::Processing, kKey), nullptr);

  bool checked = false;
  ActionEngine engine = makeCatalogEngine(project, gatherer);
  engine.process = [&](const std::string& destination, ProcessingStep, const Settings&) -> InstanceHandle {
    // the project already reports the container as done while the action runs
    project->add(fixtures::instanceRecord(destination));
    intel.regenerateActions();
    const Action* running = intel.actions().find(ActionType::Processing, destination);
    EXPECT_TRUE(running != nullptr && running->isRunning);
    checked = true;
    return project->instances().at(destination);
  };
  intel.setActionEngine(engine);

  intel.executeAction(0);
  EXPECT_TRUE(checked);
  EXPECT_EQ(intel.actions().find(ActionType::Processing, kKey), nullptr);
  EXPECT_TRUE(intel.actions().empty());
}

TEST_F(IntelligenceTest, MonitorSkipsUnreadableFileAndKeepsOthers) {
  fixtures::TempDir dir;
  const std::string bad = dir.file("0005_line.kmall");
  const std::string good = dir.file("0006_line.kmall");
  gatherer->set(good, fixtures::kmallAttrs(241, fixtures::kLineStart + 2400.0, 140.0));
  gatherer->fail(bad, "permission denied");

  intel.startFolderMonitor(dir.path().string(), false);
  fixtures::writeBytes(bad, "kmall");
  fixtures::writeBytes(good, "kmall");
  EXPECT_EQ(intel.pollMonitors(), 2u);
  EXPECT_TRUE(intel.multibeam().contains(good));
  EXPECT_FALSE(intel.multibeam().contains(bad));
  // a later poll does not replay the failed event
  EXPECT_EQ(intel.pollMonitors(), 0u);
}

#include <gtest/gtest.h>

#include "docsync/core/version_metadata.hpp"
#include "docsync/sync/reconciliation_engine.hpp"
#include "fake_remote_store.hpp"
#include "scripted_decision_provider.hpp"
#include "temp_directory.hpp"
#include "test_helpers.hpp"

using namespace docsync;
using namespace docsync::sync;
using namespace docsync::test;

namespace {

constexpr const char* kArtifactPath = ".github/copilot-instructions.md";
constexpr const char* kT1 = "2025-01-01T10:00:00.000Z";
constexpr const char* kT2 = "2025-01-02T10:00:00.000Z";
constexpr const char* kNowMarker = "<!-- VERSION: %s LAST_MODIFIED: 2025-06-01T12:00:00.000Z -->\n";

std::string stampedAtNow(const std::string& version, const std::string& body) {
  std::string marker = kNowMarker;
  marker.replace(marker.find("%s"), 2, version);
  return marker + body;
}

}  // namespace

TEST(ClassifyTest, PresenceCombinations) {
  using R = ClassificationResult;
  EXPECT_EQ(ReconciliationEngine::classify(std::nullopt, std::nullopt),
            (R{Classification::kBothAbsent, Direction::kNone}));
  EXPECT_EQ(ReconciliationEngine::classify(std::nullopt, std::string("x")),
            (R{Classification::kRemoteOnly, Direction::kNone}));
  EXPECT_EQ(ReconciliationEngine::classify(std::string("x"), std::nullopt),
            (R{Classification::kLocalOnly, Direction::kNone}));
}

TEST(ClassifyTest, MarkerDifferencesAreIdentical) {
  auto result = ReconciliationEngine::classify(artifact("Hello", "1.0.0", kT1),
                                               artifact("Hello\n", "1.0.7", kT2));
  EXPECT_EQ(result.classification, Classification::kIdentical);
}

TEST(ClassifyTest, TimestampsDecideDirection) {
  auto remote_newer = ReconciliationEngine::classify(artifact("a", "1.0.5", kT1),
                                                     artifact("b", "1.0.1", kT2));
  EXPECT_EQ(remote_newer.classification, Classification::kDiverged);
  EXPECT_EQ(remote_newer.direction, Direction::kRemoteNewer);

  auto local_newer = ReconciliationEngine::classify(artifact("a", "1.0.0", kT2),
                                                    artifact("b", "1.0.9", kT1));
  EXPECT_EQ(local_newer.direction, Direction::kLocalNewer);
}

TEST(ClassifyTest, MissingOrEqualTimestampsAreAmbiguous) {
  EXPECT_EQ(ReconciliationEngine::classify(std::string("a"), artifact("b", "1.0.0", kT1)).direction,
            Direction::kAmbiguous);
  EXPECT_EQ(ReconciliationEngine::classify(artifact("a", "1.0.0", "unknown"),
                                           artifact("b", "1.0.0", kT1)).direction,
            Direction::kAmbiguous);
  EXPECT_EQ(ReconciliationEngine::classify(artifact("a", "1.0.0", kT1),
                                           artifact("b", "1.0.1", kT1)).direction,
            Direction::kAmbiguous);
}

class ReconciliationEngineTest : public ::testing::Test {
 protected:
  void SetUp() override {
    local_ = std::make_unique<store::LocalArtifactStore>(temp_.path(), "copilot-instructions.md");
  }

  // Engine bound to the fake remote; `remote_id` empty means none configured
  std::unique_ptr<ReconciliationEngine> makeEngine(const std::string& remote_id = "gist-1",
                                                   EngineOptions options = {}) {
    std::optional<std::string> id;
    if (!remote_id.empty()) id = remote_id;
    auto engine = std::make_unique<ReconciliationEngine>(*local_, remote_, id, options);
    engine->setClock([] { return fixedNow(); });
    engine->setRemoteIdPersister([this](const std::string& new_id) -> Result<void> {
      persisted_.push_back(new_id);
      if (persist_error_) {
        return std::unexpected(*persist_error_);
      }
      return {};
    });
    return engine;
  }

  void writeLocal(const std::string& content) { temp_.createFile(kArtifactPath, content); }
  std::string readLocal() const { return temp_.readFile(kArtifactPath); }
  bool localExists() const { return temp_.exists(kArtifactPath); }

  TempDirectory temp_;
  std::unique_ptr<store::LocalArtifactStore> local_;
  FakeRemoteStore remote_;
  std::vector<std::string> persisted_;
  std::optional<Error> persist_error_;
};

// Local absent, remote "# Guide" without marker
TEST_F(ReconciliationEngineTest, RemoteOnlyDownloadsVerbatim) {
  remote_.seed("gist-1", "# Guide");
  auto engine = makeEngine();

  auto outcome = engine->reconcile(SyncMode::kAutonomous);

  ASSERT_TRUE(outcome.ok()) << outcome.error->message();
  EXPECT_EQ(outcome.classification, Classification::kRemoteOnly);
  EXPECT_EQ(outcome.action, ActionTaken::kDownloaded);
  EXPECT_EQ(outcome.local_path, local_->defaultPath());
  EXPECT_EQ(readLocal(), "# Guide");
  EXPECT_EQ(remote_.putCount(), 0);
  EXPECT_EQ(temp_.readFile(".gitignore"), std::string(kArtifactPath) + "\n");
}

// Same body, different markers, remote newer
TEST_F(ReconciliationEngineTest, MarkerOnlyDifferenceIsANoOp) {
  const std::string local = "<!--VERSION:1.0.0 LAST_MODIFIED:2025-01-01T10:00:00Z-->Hello";
  writeLocal(local);
  remote_.seed("gist-1", "<!--VERSION:1.0.1 LAST_MODIFIED:2025-01-02T10:00:00Z-->Hello");
  auto engine = makeEngine();

  auto outcome = engine->reconcile(SyncMode::kAutonomous);

  ASSERT_TRUE(outcome.ok());
  EXPECT_EQ(outcome.classification, Classification::kIdentical);
  EXPECT_EQ(outcome.action, ActionTaken::kNoOp);
  EXPECT_EQ(readLocal(), local);
  EXPECT_EQ(remote_.putCount(), 0);
  EXPECT_FALSE(temp_.exists(".gitignore"));
}

// Remote body changed and carries the later timestamp
TEST_F(ReconciliationEngineTest, RemoteNewerDownloadsAndOverwrites) {
  writeLocal(artifact("Hello", "1.0.0", kT1));
  const std::string remote = artifact("Hello world", "1.0.1", kT2);
  remote_.seed("gist-1", remote);
  auto engine = makeEngine();

  auto outcome = engine->reconcile(SyncMode::kAutonomous);

  ASSERT_TRUE(outcome.ok());
  EXPECT_EQ(outcome.classification, Classification::kDiverged);
  EXPECT_EQ(outcome.direction, Direction::kRemoteNewer);
  EXPECT_EQ(outcome.action, ActionTaken::kDownloaded);
  EXPECT_EQ(readLocal(), remote);
  EXPECT_EQ(remote_.putCount(), 0);
}

// Upload of content the remote already holds, marker aside
TEST_F(ReconciliationEngineTest, UploadOfUnchangedContentShortCircuits) {
  const std::string local = artifact("Hello", "1.0.4", kT2);
  writeLocal(local);
  remote_.seed("gist-1", artifact("Hello", "1.0.3", kT1));
  auto before = std::filesystem::last_write_time(temp_.path() / kArtifactPath);
  auto engine = makeEngine();

  auto outcome = engine->upload();

  ASSERT_TRUE(outcome.ok());
  EXPECT_EQ(outcome.action, ActionTaken::kAlreadySynced);
  EXPECT_EQ(readLocal(), local);
  EXPECT_EQ(std::filesystem::last_write_time(temp_.path() / kArtifactPath), before);
  EXPECT_EQ(remote_.putCount(), 0);
}

TEST_F(ReconciliationEngineTest, LocalOnlyUploadsAndPersistsNewId) {
  writeLocal("plain body");
  auto engine = makeEngine("");

  auto outcome = engine->reconcile(SyncMode::kAutonomous);

  ASSERT_TRUE(outcome.ok());
  EXPECT_EQ(outcome.classification, Classification::kLocalOnly);
  EXPECT_EQ(outcome.action, ActionTaken::kUploaded);
  EXPECT_EQ(remote_.fetchCount(), 0);

  const std::string expected = stampedAtNow("1.0.1", "plain body");
  EXPECT_EQ(readLocal(), expected);
  EXPECT_EQ(remote_.storedContent(), expected);
  ASSERT_EQ(remote_.putIds().size(), 1u);
  EXPECT_FALSE(remote_.putIds()[0].has_value());

  ASSERT_TRUE(outcome.remote.has_value());
  EXPECT_EQ(outcome.remote->id, "gist-new");
  EXPECT_EQ(engine->remoteId(), "gist-new");
  EXPECT_EQ(persisted_, std::vector<std::string>{"gist-new"});
}

TEST_F(ReconciliationEngineTest, LocalNewerUploadsWithBumpedVersion) {
  writeLocal(artifact("Hello local", "1.0.3", kT2));
  remote_.seed("gist-1", artifact("Hello remote", "1.0.3", kT1));
  auto engine = makeEngine();

  auto outcome = engine->reconcile(SyncMode::kAutonomous);

  ASSERT_TRUE(outcome.ok());
  EXPECT_EQ(outcome.direction, Direction::kLocalNewer);
  EXPECT_EQ(outcome.action, ActionTaken::kUploaded);

  const std::string expected = stampedAtNow("1.0.4", "Hello local");
  EXPECT_EQ(readLocal(), expected);
  EXPECT_EQ(remote_.storedContent(), expected);
  ASSERT_EQ(remote_.putIds().size(), 1u);
  EXPECT_EQ(remote_.putIds()[0], std::optional<std::string>("gist-1"));
  EXPECT_TRUE(persisted_.empty());
}

TEST_F(ReconciliationEngineTest, AmbiguousDivergenceIsLeftAloneAutonomously) {
  writeLocal("local edit");
  remote_.seed("gist-1", "remote edit");
  auto engine = makeEngine();

  auto outcome = engine->reconcile(SyncMode::kAutonomous);

  ASSERT_TRUE(outcome.ok());
  EXPECT_EQ(outcome.direction, Direction::kAmbiguous);
  EXPECT_EQ(outcome.action, ActionTaken::kNoOp);
  EXPECT_EQ(readLocal(), "local edit");
  EXPECT_EQ(remote_.storedContent(), "remote edit");
  EXPECT_EQ(remote_.putCount(), 0);
}

TEST_F(ReconciliationEngineTest, EqualTimestampsAreLeftAlone) {
  writeLocal(artifact("a", "1.0.2", kT1));
  remote_.seed("gist-1", artifact("b", "1.0.2", kT1));
  auto engine = makeEngine();

  auto outcome = engine->reconcile(SyncMode::kAutonomous);

  EXPECT_EQ(outcome.direction, Direction::kAmbiguous);
  EXPECT_EQ(outcome.action, ActionTaken::kNoOp);
  EXPECT_EQ(remote_.putCount(), 0);
}

TEST_F(ReconciliationEngineTest, BothAbsentAutonomousDoesNothing) {
  auto engine = makeEngine();

  auto outcome = engine->reconcile(SyncMode::kAutonomous);

  ASSERT_TRUE(outcome.ok());
  EXPECT_EQ(outcome.classification, Classification::kBothAbsent);
  EXPECT_EQ(outcome.action, ActionTaken::kNoOp);
  EXPECT_FALSE(localExists());
  EXPECT_EQ(remote_.putCount(), 0);
}

TEST_F(ReconciliationEngineTest, NoRemoteIdMeansRemoteAbsent) {
  remote_.seed("gist-1", "# Guide");
  auto engine = makeEngine("");

  auto outcome = engine->reconcile(SyncMode::kAutonomous);

  EXPECT_EQ(outcome.classification, Classification::kBothAbsent);
  EXPECT_EQ(remote_.fetchCount(), 0);
}

TEST_F(ReconciliationEngineTest, InteractiveBothAbsentOffersTemplate) {
  ScriptedDecisionProvider decisions({Choice::kCreateTemplate});
  auto engine = makeEngine();

  auto outcome = engine->reconcile(SyncMode::kInteractive, &decisions);

  ASSERT_TRUE(outcome.ok());
  EXPECT_EQ(outcome.action, ActionTaken::kCreatedTemplate);
  ASSERT_EQ(decisions.requests().size(), 1u);
  EXPECT_EQ(decisions.requests()[0].options,
            (std::vector<Choice>{Choice::kCreateTemplate, Choice::kCancel}));

  auto meta = core::VersionMetadataCodec::extract(readLocal());
  ASSERT_TRUE(meta.has_value());
  EXPECT_EQ(meta->version.toString(), "1.0.0");
  EXPECT_EQ(meta->last_modified, fixedNow());
  EXPECT_EQ(remote_.putCount(), 0);
}

TEST_F(ReconciliationEngineTest, InteractiveRemoteOnlyConfirmDownloads) {
  remote_.seed("gist-1", "# Guide");
  ScriptedDecisionProvider decisions({Choice::kConfirm});
  auto engine = makeEngine();

  auto outcome = engine->reconcile(SyncMode::kInteractive, &decisions);

  EXPECT_EQ(outcome.action, ActionTaken::kDownloaded);
  EXPECT_EQ(readLocal(), "# Guide");
  EXPECT_EQ(decisions.requests()[0].options,
            (std::vector<Choice>{Choice::kConfirm, Choice::kCancel}));
}

TEST_F(ReconciliationEngineTest, InteractiveCancelLeavesEverythingAlone) {
  remote_.seed("gist-1", "# Guide");
  ScriptedDecisionProvider decisions({Choice::kCancel});
  auto engine = makeEngine();

  auto outcome = engine->reconcile(SyncMode::kInteractive, &decisions);

  ASSERT_TRUE(outcome.ok());
  EXPECT_EQ(outcome.action, ActionTaken::kCancelled);
  EXPECT_FALSE(localExists());
}

TEST_F(ReconciliationEngineTest, InteractiveLocalOnlyConfirmUploads) {
  writeLocal("body");
  ScriptedDecisionProvider decisions({Choice::kConfirm});
  auto engine = makeEngine("");

  auto outcome = engine->reconcile(SyncMode::kInteractive, &decisions);

  EXPECT_EQ(outcome.action, ActionTaken::kUploaded);
  EXPECT_EQ(remote_.putCount(), 1);
}

TEST_F(ReconciliationEngineTest, InteractiveIdenticalReportsAlreadySynced) {
  writeLocal(artifact("same", "1.0.0", kT1));
  remote_.seed("gist-1", artifact("same", "1.0.0", kT1));
  ScriptedDecisionProvider decisions;
  auto engine = makeEngine();

  auto outcome = engine->reconcile(SyncMode::kInteractive, &decisions);

  EXPECT_EQ(outcome.action, ActionTaken::kAlreadySynced);
  EXPECT_TRUE(decisions.requests().empty());
}

TEST_F(ReconciliationEngineTest, InteractiveRemoteNewerCanUploadInstead) {
  writeLocal(artifact("mine", "1.0.1", kT1));
  remote_.seed("gist-1", artifact("theirs", "1.0.2", kT2));
  ScriptedDecisionProvider decisions({Choice::kUpload});
  auto engine = makeEngine();

  auto outcome = engine->reconcile(SyncMode::kInteractive, &decisions);

  EXPECT_EQ(outcome.action, ActionTaken::kUploaded);
  EXPECT_EQ(decisions.requests()[0].options,
            (std::vector<Choice>{Choice::kDownload, Choice::kUpload, Choice::kCancel}));
  EXPECT_EQ(remote_.storedContent(), stampedAtNow("1.0.2", "mine"));
}

TEST_F(ReconciliationEngineTest, InteractiveLocalNewerOffersUploadFirst) {
  writeLocal(artifact("mine", "1.0.1", kT2));
  remote_.seed("gist-1", artifact("theirs", "1.0.2", kT1));
  ScriptedDecisionProvider decisions({Choice::kDownload});
  auto engine = makeEngine();

  auto outcome = engine->reconcile(SyncMode::kInteractive, &decisions);

  EXPECT_EQ(outcome.action, ActionTaken::kDownloaded);
  EXPECT_EQ(decisions.requests()[0].options,
            (std::vector<Choice>{Choice::kUpload, Choice::kDownload, Choice::kCancel}));
  EXPECT_EQ(readLocal(), artifact("theirs", "1.0.2", kT1));
}

TEST_F(ReconciliationEngineTest, InteractiveAmbiguousAsksTheUser) {
  writeLocal("mine");
  remote_.seed("gist-1", "theirs");
  ScriptedDecisionProvider decisions({Choice::kDownload});
  auto engine = makeEngine();

  auto outcome = engine->reconcile(SyncMode::kInteractive, &decisions);

  EXPECT_EQ(outcome.direction, Direction::kAmbiguous);
  EXPECT_EQ(outcome.action, ActionTaken::kDownloaded);
  EXPECT_EQ(readLocal(), "theirs");
}

TEST_F(ReconciliationEngineTest, UnofferedChoiceCancels) {
  remote_.seed("gist-1", "# Guide");
  ScriptedDecisionProvider decisions({Choice::kUpload});
  auto engine = makeEngine();

  auto outcome = engine->reconcile(SyncMode::kInteractive, &decisions);

  EXPECT_EQ(outcome.action, ActionTaken::kCancelled);
  EXPECT_FALSE(localExists());
  EXPECT_EQ(remote_.putCount(), 0);
}

TEST_F(ReconciliationEngineTest, InteractiveWithoutProviderIsRejected) {
  auto engine = makeEngine();
  auto outcome = engine->reconcile(SyncMode::kInteractive, nullptr);
  ASSERT_FALSE(outcome.ok());
  EXPECT_EQ(outcome.error->code(), ErrorCode::kInvalidArgument);
}

TEST_F(ReconciliationEngineTest, FetchFailureAbortsWithoutTouchingLocal) {
  writeLocal("local only?");
  remote_.seed("gist-1", "remote");
  remote_.failNextFetch(makeError(ErrorCode::kNetworkError, "offline"));
  auto engine = makeEngine();

  auto outcome = engine->reconcile(SyncMode::kAutonomous);

  ASSERT_FALSE(outcome.ok());
  EXPECT_EQ(outcome.error->code(), ErrorCode::kNetworkError);
  EXPECT_EQ(outcome.action, ActionTaken::kNoOp);
  EXPECT_EQ(readLocal(), "local only?");
  EXPECT_EQ(remote_.putCount(), 0);
}

TEST_F(ReconciliationEngineTest, PutFailureIsReported) {
  writeLocal("body");
  remote_.failNextPut(makeError(ErrorCode::kRateLimited, "slow down"));
  auto engine = makeEngine("");

  auto outcome = engine->reconcile(SyncMode::kAutonomous);

  ASSERT_FALSE(outcome.ok());
  EXPECT_EQ(outcome.error->code(), ErrorCode::kRateLimited);
  EXPECT_TRUE(persisted_.empty());
  EXPECT_FALSE(engine->remoteId().has_value());
}

TEST_F(ReconciliationEngineTest, PersisterFailureIsNotFatal) {
  writeLocal("body");
  persist_error_ = makeError(ErrorCode::kConfigError, "read-only config");
  auto engine = makeEngine("");

  auto outcome = engine->upload();

  ASSERT_TRUE(outcome.ok());
  EXPECT_EQ(outcome.action, ActionTaken::kUploaded);
  EXPECT_EQ(engine->remoteId(), "gist-new");
}

TEST_F(ReconciliationEngineTest, ForcedUploadOfUnchangedContentSkipsBump) {
  const std::string local = artifact("Hello", "1.0.4", kT2);
  writeLocal(local);
  remote_.seed("gist-1", artifact("Hello", "1.0.3", kT1));
  auto engine = makeEngine();

  auto outcome = engine->upload(true);

  ASSERT_TRUE(outcome.ok());
  EXPECT_EQ(outcome.action, ActionTaken::kUploaded);
  EXPECT_EQ(readLocal(), local);
  EXPECT_EQ(remote_.storedContent(), local);
}

TEST_F(ReconciliationEngineTest, UploadWithoutLocalFails) {
  auto engine = makeEngine();
  auto outcome = engine->upload();
  ASSERT_FALSE(outcome.ok());
  EXPECT_EQ(outcome.error->code(), ErrorCode::kFileNotFound);
}

TEST_F(ReconciliationEngineTest, DownloadWithoutRemoteFails) {
  writeLocal("body");
  auto engine = makeEngine();
  auto outcome = engine->download();
  ASSERT_FALSE(outcome.ok());
  EXPECT_EQ(outcome.error->code(), ErrorCode::kNotFound);
  EXPECT_EQ(readLocal(), "body");
}

TEST_F(ReconciliationEngineTest, DownloadKeepsExistingRootLocation) {
  temp_.createFile("copilot-instructions.md", "old");
  remote_.seed("gist-1", "new");
  auto engine = makeEngine();

  auto outcome = engine->download();

  ASSERT_TRUE(outcome.ok());
  EXPECT_EQ(outcome.local_path, temp_.path() / "copilot-instructions.md");
  EXPECT_EQ(temp_.readFile("copilot-instructions.md"), "new");
  EXPECT_FALSE(localExists());
  EXPECT_EQ(temp_.readFile(".gitignore"), "copilot-instructions.md\n");
}

TEST_F(ReconciliationEngineTest, DownloadWithoutAutoExclude) {
  remote_.seed("gist-1", "# Guide");
  EngineOptions options;
  options.auto_exclude = false;
  auto engine = makeEngine("gist-1", options);

  auto outcome = engine->download();

  ASSERT_TRUE(outcome.ok());
  EXPECT_FALSE(temp_.exists(".gitignore"));
}

TEST_F(ReconciliationEngineTest, CreateTemplateRefusesToOverwrite) {
  writeLocal("existing");
  auto engine = makeEngine();

  auto outcome = engine->createTemplate();

  ASSERT_FALSE(outcome.ok());
  EXPECT_EQ(outcome.error->code(), ErrorCode::kInvalidState);
  EXPECT_EQ(readLocal(), "existing");
}

TEST_F(ReconciliationEngineTest, CreateTemplateDoesNotContactRemote) {
  auto engine = makeEngine();
  auto outcome = engine->createTemplate();
  ASSERT_TRUE(outcome.ok());
  EXPECT_EQ(outcome.action, ActionTaken::kCreatedTemplate);
  EXPECT_TRUE(localExists());
  EXPECT_EQ(remote_.fetchCount(), 0);
}

TEST_F(ReconciliationEngineTest, InspectReportsBothSides) {
  writeLocal(artifact("Hello", "1.0.2", kT1));
  remote_.seed("gist-1", "Hello world");
  auto engine = makeEngine();

  auto report = engine->inspect();

  ASSERT_OK(report);
  EXPECT_EQ(report->classification.classification, Classification::kDiverged);
  EXPECT_EQ(report->local_version, "1.0.2");
  EXPECT_EQ(report->remote_version, "1.0.0");
  ASSERT_TRUE(report->local_fingerprint.has_value());
  ASSERT_TRUE(report->remote_fingerprint.has_value());
  EXPECT_NE(*report->local_fingerprint, *report->remote_fingerprint);
  EXPECT_EQ(report->remote_id, "gist-1");
  EXPECT_EQ(readLocal(), artifact("Hello", "1.0.2", kT1));
  EXPECT_EQ(remote_.putCount(), 0);
}

TEST_F(ReconciliationEngineTest, InspectPropagatesTransportErrors) {
  remote_.failNextFetch(makeError(ErrorCode::kAuthError, "bad token"));
  auto engine = makeEngine();
  EXPECT_ERROR(engine->inspect(), ErrorCode::kAuthError);
}

#pragma once

#include <filesystem>
#include <functional>
#include <iosfwd>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <CLI/CLI.hpp>

#include "docsync/common.hpp"
#include "docsync/config/config.hpp"
#include "docsync/remote/remote_store.hpp"
#include "docsync/store/local_artifact_store.hpp"
#include "docsync/sync/reconciliation_engine.hpp"
#include "docsync/util/file_lock.hpp"

namespace docsync::cli {

/**
 * @brief Global CLI options that are available to all commands
 */
struct GlobalOptions {
  bool json = false;           // --json: Output in JSON format
  int verbose = 0;             // --verbose: Verbose output level (can be repeated: -v, -vv)
  bool quiet = false;          // --quiet: Suppress normal output
  std::string config_file;     // --config: Path to config file
  std::string workspace;       // --workspace: Override workspace directory
};

/**
 * @brief Base class for all CLI commands
 */
class Command {
public:
  virtual ~Command() = default;

  /**
   * @brief Execute the command with the given arguments
   * @param options Global CLI options
   * @return Result with exit code (0 = success)
   */
  virtual Result<int> execute(const GlobalOptions& options) = 0;

  virtual std::string name() const = 0;
  virtual std::string description() const = 0;

  /**
   * @brief Setup command-specific CLI options (optional override)
   */
  virtual void setupCommand(CLI::App* cmd) { (void)cmd; }
};

// Everything one reconciliation pass needs; the engine borrows the stores.
// The workspace lock is held until the context is destroyed.
struct SyncContext {
  std::optional<util::FileLock> lock;
  std::unique_ptr<store::LocalArtifactStore> local;
  std::unique_ptr<remote::RemoteStore> remote;
  std::unique_ptr<sync::ReconciliationEngine> engine;
};

/**
 * @brief Main CLI application
 */
class Application {
public:
  using RemoteStoreFactory =
      std::function<std::unique_ptr<remote::RemoteStore>(const config::Config&)>;

  Application();
  // Tests substitute the remote replica through `remote_factory`
  explicit Application(RemoteStoreFactory remote_factory);
  ~Application() = default;

  /**
   * @brief Run the application with command line arguments
   * @return Exit code (0 = success)
   */
  int run(int argc, char* argv[]);

  // Load configuration and set up logging; idempotent
  Result<void> initialize();

  // Service accessors for commands
  const GlobalOptions& globalOptions() const;
  config::Config& config();
  std::mutex& configMutex() { return config_mutex_; }
  std::filesystem::path workspace() const;

  // Re-read the configuration file; used by `watch` on config changes
  Result<void> reloadConfig();

  // Stores and engine for one pass over a configuration snapshot. Fails with
  // kInvalidState while another pass on the same workspace holds the lock.
  Result<SyncContext> createSyncContext(const config::Config& snapshot);
  Result<SyncContext> createSyncContext();

  // Lock file shared by every docsync process working on `workspace`
  static std::filesystem::path syncLockPath(const std::filesystem::path& workspace);

  // Saves a newly created remote id into the configuration file
  Result<void> persistRemoteId(const std::string& id);

  // Prompt streams used by interactive commands
  void setPromptStreams(std::istream& in, std::ostream& out);
  std::istream& promptInput() { return *prompt_in_; }
  std::ostream& promptOutput() { return *prompt_out_; }

  // Disable the rotating log file (tests)
  void setFileLogging(bool enabled) { file_logging_ = enabled; }

private:
  void setupGlobalOptions();
  void setupCommands();
  void setupHelp();

  void registerCommand(std::unique_ptr<Command> command);

  Result<void> initializeServices();
  std::filesystem::path resolveConfigPath() const;

  CLI::App app_;
  GlobalOptions global_options_;

  config::Config config_;
  std::mutex config_mutex_;
  RemoteStoreFactory remote_factory_;
  bool services_initialized_ = false;
  bool file_logging_ = true;

  std::istream* prompt_in_;
  std::ostream* prompt_out_;

  std::vector<std::unique_ptr<Command>> commands_;
};

} // namespace docsync::cli

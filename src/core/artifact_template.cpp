#include "docsync/core/artifact_template.hpp"

#include "docsync/core/version_metadata.hpp"

namespace docsync::core {

const std::string& ArtifactTemplate::body() {
  static const std::string kBody = R"(# Copilot Instructions

## Core Principles
- Use descriptive variable and function names
- Write clear, concise comments for complex logic
- Prioritize readability and maintainability
- Separate concerns (models, views, controllers, etc.)

## Version Control
- Stage and commit all changes when finishing a task
- Use conventional commit messages (`feat:`, `fix:`, `chore:`, `docs:`)
- Keep large generated files out of the repository via `.gitignore`

## Code Quality
- Run the project's linters and formatters before committing
- Validate and sanitize all external input
- Provide meaningful error messages

## Testing
- Add tests alongside new behaviour
- Keep tests deterministic and independent of execution order

## Project-Specific Notes
<!-- Add any project-specific guidelines here -->
)";
  return kBody;
}

std::string ArtifactTemplate::render(std::chrono::system_clock::time_point now) {
  VersionMetadata metadata;
  metadata.version = SemVer{1, 0, 0};
  metadata.last_modified = now;
  return VersionMetadataCodec::inject(body(), metadata);
}

}  // namespace docsync::core

#ifndef ASSET_TRANSFORMER_HPP
#define ASSET_TRANSFORMER_HPP

#include "asset_ledger.hpp"
#include "script_minifier.hpp"

#include <filesystem>
#include <memory>
#include <string>

namespace fs = std::filesystem;

// Produces one output file for an asset. Called once per unique build path
// during the merge phase. Returns a short note for the build log, e.g.
// "minified", or an empty string.
class AssetTransformer {
public:
  virtual ~AssetTransformer() = default;

  virtual std::string transform(const AssetRecord &record,
                                const fs::path &destination) = 0;
};

// Byte-for-byte copy.
class CopyTransformer : public AssetTransformer {
public:
  std::string transform(const AssetRecord &record,
                        const fs::path &destination) override;
};

// Copies images verbatim. Resizing and format conversion need a real image
// transformer, so requested options only produce a warning here.
class ImageCopyTransformer : public CopyTransformer {
public:
  std::string transform(const AssetRecord &record,
                        const fs::path &destination) override;
};

// Runs scripts through Terser and styles through csso. Files the minifier
// cannot handle are copied as written.
class MinifyTransformer : public AssetTransformer {
public:
  explicit MinifyTransformer(std::shared_ptr<ScriptMinifier> minifier)
      : minifier_(std::move(minifier)) {}

  std::string transform(const AssetRecord &record,
                        const fs::path &destination) override;

private:
  std::shared_ptr<ScriptMinifier> minifier_;
};

std::string read_asset(const fs::path &path);
void write_output_file(const fs::path &path, const std::string &content);

#endif

#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "corpus/test_vector.h"

namespace Concord {

/**
 * A vector file that could not be loaded. Excluded from the run, never fatal
 * to the batch.
 */
struct CorpusError {
    std::string path;
    std::string reason;
};

struct LoadResult {
    TestVectorPtr vector;
    std::optional<CorpusError> error;

    bool ok() const { return vector != nullptr; }
};

struct Corpus {
    std::vector<TestVectorPtr> vectors;
    std::vector<CorpusError> errors;
};

/**
 * Decodes the JSON envelope of a message-class test vector together with its
 * embedded CAR archive.
 */
class VectorLoader {
public:
    static LoadResult LoadFile(const std::filesystem::path& path);

    /**
     * @param origin     path reported in a CorpusError
     * @param default_id id used when the envelope has no _meta.id
     */
    static LoadResult LoadString(std::string_view json, const std::string& origin,
                                 const std::string& default_id);
};

/**
 * Load every *.json file below `root`, in sorted path order.
 * @return false only when `root` itself cannot be read
 */
bool LoadCorpus(const std::filesystem::path& root, Corpus& corpus, std::string* fatal_error);

} // namespace Concord

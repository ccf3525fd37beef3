#include "vector_loader.h"

#include <algorithm>
#include <fstream>
#include <set>
#include <sstream>
#include <stdexcept>

#include <glog/logging.h>
#include <yaml-cpp/yaml.h>
#include <yaml-cpp/binary.h>

#include "corpus/car_reader.h"

namespace Concord {

namespace {

class LoadFailure : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

std::string DecodeBase64Field(const YAML::Node& node, const char* what) {
    const std::string encoded = node.as<std::string>();
    if (encoded.empty()) {
        return std::string();
    }
    std::vector<unsigned char> raw = YAML::DecodeBase64(encoded);
    if (raw.empty()) {
        throw LoadFailure(std::string("invalid base64 in ") + what);
    }
    return std::string(raw.begin(), raw.end());
}

// Accepts both {"/": "bafy..."} and a bare string.
Cid ParseCidNode(const YAML::Node& node, const char* what) {
    if (!node) {
        throw LoadFailure(std::string("missing ") + what);
    }
    std::string text;
    if (node.IsMap() && node["/"]) {
        text = node["/"].as<std::string>();
    } else if (node.IsScalar()) {
        text = node.as<std::string>();
    } else {
        throw LoadFailure(std::string("malformed CID in ") + what);
    }
    auto cid = Cid::FromString(text);
    if (!cid) {
        throw LoadFailure(std::string("unparsable CID '") + text + "' in " + what);
    }
    return *cid;
}

// Token amounts arrive either as JSON numbers or decimal strings.
uint64_t ParseAmount(const YAML::Node& node, const char* what) {
    if (!node) {
        return 0;
    }
    const std::string text = node.as<std::string>();
    if (text.find('-') != std::string::npos) {
        throw LoadFailure(std::string("negative amount '") + text + "' in " + what);
    }
    try {
        size_t pos = 0;
        uint64_t value = std::stoull(text, &pos);
        if (pos != text.size()) {
            throw LoadFailure(std::string("trailing characters in ") + what);
        }
        return value;
    } catch (const std::logic_error&) {
        throw LoadFailure(std::string("invalid amount '") + text + "' in " + what);
    }
}

// Variants listed without an id are named by version and epoch.
std::string DerivedVariantId(const Variant& variant) {
    return "nv" + std::to_string(variant.network_version) + "@" + std::to_string(variant.epoch);
}

TolerancePolicy ParseTolerance(const YAML::Node& node) {
    std::optional<uint64_t> abs_delta;
    std::optional<double> rel_delta;
    if (node["gas_abs"]) abs_delta = node["gas_abs"].as<uint64_t>();
    if (node["gas_rel"]) rel_delta = node["gas_rel"].as<double>();
    if (!abs_delta && !rel_delta) {
        return TolerancePolicy::Exact();
    }
    if (rel_delta && *rel_delta < 0.0) {
        throw LoadFailure("negative gas_rel tolerance");
    }
    return TolerancePolicy::Relaxed(abs_delta, rel_delta);
}

TestVectorPtr ParseEnvelope(const YAML::Node& root, const std::string& default_id) {
    if (!root.IsMap()) {
        throw LoadFailure("vector envelope is not an object");
    }
    const std::string cls = root["class"] ? root["class"].as<std::string>() : "";
    if (cls != "message") {
        throw LoadFailure("unsupported vector class '" + cls + "'");
    }

    auto vector = std::make_shared<TestVector>();
    vector->id = (root["_meta"] && root["_meta"]["id"]) ? root["_meta"]["id"].as<std::string>() : default_id;

    if (const auto selector = root["selector"]) {
        if (!selector.IsMap()) {
            throw LoadFailure("selector is not an object");
        }
        for (const auto& kv : selector) {
            if (!kv.second.IsScalar()) {
                throw LoadFailure("selector '" + kv.first.as<std::string>() + "' is not a scalar");
            }
            vector->selectors[kv.first.as<std::string>()] = kv.second.as<std::string>();
        }
    }

    // Embedded archive.
    if (!root["car"]) {
        throw LoadFailure("missing car");
    }
    std::string car_bytes = DecodeBase64Field(root["car"], "car");
    std::string car;
    std::string error;
    if (!CarReader::MaybeGunzip(car_bytes, car, &error)) {
        throw LoadFailure(error);
    }
    auto store = std::make_shared<MemoryBlockstore>();
    if (!CarReader::Load(car, *store, &error)) {
        throw LoadFailure(error);
    }
    vector->blockstore = store;

    const auto pre = root["preconditions"];
    if (!pre) {
        throw LoadFailure("missing preconditions");
    }
    vector->car_root = ParseCidNode(pre["state_tree"] ? pre["state_tree"]["root_cid"] : YAML::Node(),
                                    "preconditions.state_tree.root_cid");
    vector->base_fee = ParseAmount(pre["basefee"], "preconditions.basefee");
    vector->circ_supply = ParseAmount(pre["circ_supply"], "preconditions.circ_supply");

    if (pre["variants"] && pre["variants"].size() > 0) {
        std::set<std::string> variant_ids;
        for (const auto& v : pre["variants"]) {
            Variant variant;
            variant.id = v["id"] ? v["id"].as<std::string>() : "";
            variant.network_version = v["nv"].as<uint32_t>();
            variant.epoch = v["epoch"] ? v["epoch"].as<int64_t>() : 0;
            if (variant.id.empty()) {
                variant.id = DerivedVariantId(variant);
            }
            if (!variant_ids.insert(variant.id).second) {
                throw LoadFailure("duplicate variant id '" + variant.id + "'");
            }
            vector->variants.push_back(std::move(variant));
        }
    } else {
        Variant variant;
        variant.network_version = pre["network_version"] ? pre["network_version"].as<uint32_t>() : 0;
        variant.epoch = pre["epoch"] ? pre["epoch"].as<int64_t>() : 0;
        variant.id = "nv" + std::to_string(variant.network_version);
        vector->variants.push_back(std::move(variant));
    }

    if (const auto messages = root["apply_messages"]) {
        for (const auto& m : messages) {
            ApplyMessage msg;
            msg.payload = DecodeBase64Field(m["bytes"], "apply_messages.bytes");
            msg.epoch_offset = m["epoch_offset"] ? m["epoch_offset"].as<int64_t>() : 0;
            vector->messages.push_back(std::move(msg));
        }
    }

    const auto post = root["postconditions"];
    if (!post) {
        throw LoadFailure("missing postconditions");
    }
    vector->postconditions.state_root = ParseCidNode(
        post["state_tree"] ? post["state_tree"]["root_cid"] : YAML::Node(),
        "postconditions.state_tree.root_cid");
    if (const auto receipts = post["receipts"]) {
        for (const auto& r : receipts) {
            Receipt receipt;
            receipt.exit_code = r["exit_code"].as<int64_t>();
            receipt.return_data = r["return"] ? DecodeBase64Field(r["return"], "receipts.return") : "";
            receipt.gas_used = r["gas_used"].as<uint64_t>();
            vector->postconditions.receipts.push_back(std::move(receipt));
        }
    }
    if (post["tolerance"]) {
        vector->postconditions.tolerance = ParseTolerance(post["tolerance"]);
    }
    if (vector->postconditions.receipts.size() != vector->messages.size()) {
        LOG(WARNING) << "[VectorLoader] " << vector->id << ": " << vector->messages.size()
                     << " messages but " << vector->postconditions.receipts.size() << " receipts";
    }
    return vector;
}

} // namespace

LoadResult VectorLoader::LoadString(std::string_view json, const std::string& origin,
                                    const std::string& default_id) {
    LoadResult result;
    try {
        YAML::Node root = YAML::Load(std::string(json));
        result.vector = ParseEnvelope(root, default_id);
    } catch (const LoadFailure& e) {
        result.error = CorpusError{origin, e.what()};
    } catch (const YAML::Exception& e) {
        result.error = CorpusError{origin, std::string("malformed envelope: ") + e.what()};
    }
    return result;
}

LoadResult VectorLoader::LoadFile(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        LoadResult result;
        result.error = CorpusError{path.string(), "cannot open file"};
        return result;
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    return LoadString(buffer.str(), path.string(), path.stem().string());
}

bool LoadCorpus(const std::filesystem::path& root, Corpus& corpus, std::string* fatal_error) {
    namespace fs = std::filesystem;
    std::error_code ec;
    if (!fs::is_directory(root, ec)) {
        if (fatal_error) *fatal_error = "corpus directory not readable: " + root.string();
        return false;
    }

    std::vector<fs::path> files;
    fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        if (fatal_error) *fatal_error = "cannot walk " + root.string() + ": " + ec.message();
        return false;
    }
    for (const fs::recursive_directory_iterator end{}; it != end; it.increment(ec)) {
        if (ec) {
            break;
        }
        std::error_code type_ec;
        if (it->is_regular_file(type_ec) && it->path().extension() == ".json") {
            files.push_back(it->path());
        }
    }
    if (ec) {
        if (fatal_error) *fatal_error = "cannot walk " + root.string() + ": " + ec.message();
        return false;
    }
    std::sort(files.begin(), files.end());

    std::set<std::string> seen_ids;
    for (const auto& file : files) {
        LoadResult loaded = VectorLoader::LoadFile(file);
        if (loaded.ok() && !seen_ids.insert(loaded.vector->id).second) {
            loaded.error = CorpusError{file.string(), "duplicate vector id '" + loaded.vector->id + "'"};
            loaded.vector.reset();
        }
        if (loaded.ok()) {
            VLOG(2) << "[LoadCorpus] " << loaded.vector->id << " <- " << file.string();
            corpus.vectors.push_back(std::move(loaded.vector));
        } else {
            LOG(WARNING) << "[LoadCorpus] skipping " << loaded.error->path << ": " << loaded.error->reason;
            corpus.errors.push_back(std::move(*loaded.error));
        }
    }
    LOG(INFO) << "Loaded " << corpus.vectors.size() << " vectors (" << corpus.errors.size()
              << " corpus errors) from " << root.string();
    return true;
}

} // namespace Concord

#include "NamedKeyRegistry.h"
#include "Logger.h"
#include "LoggerMacros.h"
#include "TimeUtils.h"
#include <algorithm>
#include <cctype>

namespace Signet {

namespace {

Error notFound(const std::string& name) {
    return Error{ErrorCode::NotFound, "no named key was stored at \"" + name + "\""};
}

// Releases a create-in-flight reservation on every exit path
class PendingName {
public:
    PendingName(std::mutex& mutex, std::set<std::string>& pending, std::string name)
        : mutex_(mutex), pending_(pending), name_(std::move(name)) {}

    ~PendingName() {
        std::lock_guard<std::mutex> lock(mutex_);
        pending_.erase(name_);
    }

    PendingName(const PendingName&) = delete;
    PendingName& operator=(const PendingName&) = delete;

private:
    std::mutex& mutex_;
    std::set<std::string>& pending_;
    std::string name_;
};

} // namespace

Json::Value NamedKeyConfig::toJson() const {
    Json::Value json(Json::objectValue);
    json["name"] = name;
    json["algorithm"] = signingAlgorithmName(algorithm);
    json["rotation_period"] = rotationPeriod;
    json["verification_ttl"] = verificationTtl;
    json["key_ring"] = Json::Value(Json::arrayValue);
    for (const auto& id : keyRing) {
        json["key_ring"].append(id);
    }
    json["signing_key"] = signingKeyId;
    return json;
}

NamedKeyRegistry::NamedKeyRegistry(IKeyValueStore* store, PublicKeyPublisher* publisher,
                                   IKeyGenerator* generator, KeyRing::Clock clock,
                                   size_t minimumCapacity, size_t maximumCapacity)
    : store_(store),
      publisher_(publisher),
      generator_(generator),
      clock_(clock ? std::move(clock) : KeyRing::Clock(SystemClock::now)),
      minimumCapacity_(minimumCapacity == 0 ? defaults::RING_CAPACITY : minimumCapacity),
      maximumCapacity_(std::max(maximumCapacity, minimumCapacity_)) {}

bool NamedKeyRegistry::isValidName(const std::string& name) {
    if (name.empty()) {
        return false;
    }
    for (char c : name) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_' && c != '-' && c != '.') {
            return false;
        }
    }
    return true;
}

Result<std::shared_ptr<KeyRing>> NamedKeyRegistry::buildRing(const NamedKeyRecord& header) {
    auto rotation = TimeUtils::parseDuration(header.rotationPeriod, "rotation_period");
    if (!rotation) {
        return rotation.error();
    }
    auto ttl = TimeUtils::parseDuration(header.verificationTtl, "verification_ttl");
    if (!ttl) {
        return ttl.error();
    }

    RingPolicy policy;
    policy.capacity = header.capacity;
    policy.rotationPeriod = *rotation;
    policy.verificationTtl = *ttl;
    policy.algorithm = header.algorithm;

    auto ring = KeyRing::create(header.name, policy, generator_, publisher_, clock_);
    if (!ring) {
        return ring.error();
    }
    (*ring)->attachStore(std::make_unique<NamedKeyRecordStore>(store_, header));
    return ring;
}

Result<NamedKeyConfig> NamedKeyRegistry::create(const CreateKeyRequest& request, const OperationContext& ctx) {
    auto& logger = Logger::instance();

    if (request.name.empty()) {
        return Error{ErrorCode::InvalidInput, "missing name"};
    }
    if (!isValidName(request.name)) {
        return Error{ErrorCode::InvalidInput, "invalid key name \"" + request.name + "\""};
    }

    std::string rotationText = request.rotationPeriod.empty() ? defaults::ROTATION_PERIOD : request.rotationPeriod;
    auto rotation = TimeUtils::parseDuration(rotationText, "rotation_period");
    if (!rotation) {
        return rotation.error();
    }

    std::string ttlText = request.verificationTtl.empty() ? rotationText : request.verificationTtl;
    auto ttl = TimeUtils::parseDuration(ttlText, "verification_ttl");
    if (!ttl) {
        return ttl.error();
    }

    auto algorithm = parseSigningAlgorithm(request.algorithm.empty() ? defaults::SIGNING_ALGORITHM : request.algorithm);
    if (!algorithm) {
        return algorithm.error();
    }

    size_t capacity = RingPolicy::capacityFor(*rotation, *ttl, minimumCapacity_);
    if (capacity > maximumCapacity_) {
        return Error{ErrorCode::InvalidInput,
                     "verification_ttl " + ttlText + " with rotation_period " + rotationText + " needs "
                     + std::to_string(capacity) + " keys, more than the maximum of "
                     + std::to_string(maximumCapacity_)};
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (entries_.count(request.name) || !pending_.insert(request.name).second) {
            return Error{ErrorCode::AlreadyExists, "named key \"" + request.name + "\" already exists"};
        }
    }
    PendingName reservation(mutex_, pending_, request.name);

    auto stored = store_->get(NamedKeyRecord::storageKey(request.name));
    if (!stored) {
        return stored.error();
    }
    if (stored->has_value()) {
        return Error{ErrorCode::AlreadyExists, "named key \"" + request.name + "\" already exists"};
    }

    NamedKeyRecord header;
    header.name = request.name;
    header.algorithm = *algorithm;
    header.rotationPeriod = rotationText;
    header.verificationTtl = ttlText;
    header.capacity = capacity;

    auto ring = buildRing(header);
    if (!ring) {
        return ring.error();
    }

    auto first = (*ring)->rotate(ctx);
    if (!first) {
        logger.log(LogLevel::WARN, "Creating named key " + request.name + " failed: "
                   + first.error().toString(), "Registry");
        return first.error();
    }

    auto entry = std::make_shared<Entry>();
    entry->header = header;
    entry->ring = *ring;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        entries_[request.name] = entry;
    }

    logger.log(LogLevel::INFO, "Created named key " + request.name + " (rotation " + rotationText
               + ", verification " + ttlText + ", " + std::to_string(header.capacity) + " keys)", "Registry");
    return viewOf(*entry);
}

Result<std::shared_ptr<NamedKeyRegistry::Entry>> NamedKeyRegistry::loadFromStore(const std::string& name) {
    auto stored = store_->get(NamedKeyRecord::storageKey(name));
    if (!stored) {
        return stored.error();
    }
    if (!stored->has_value()) {
        return notFound(name);
    }

    auto record = NamedKeyRecord::decode(**stored);
    if (!record) {
        Logger::instance().log(LogLevel::ERROR, "Stored named key " + name + " is unreadable: "
                               + record.error().message, "Registry");
        return record.error();
    }
    if (record->name != name) {
        return Error{ErrorCode::SerializationFailed, "record stored at \"" + name + "\" names \"" + record->name + "\""};
    }

    auto ring = buildRing(*record);
    if (!ring) {
        return ring.error();
    }
    auto restored = (*ring)->restore(record->ring);
    if (!restored) {
        return restored.error();
    }

    auto entry = std::make_shared<Entry>();
    entry->ring = *ring;
    entry->header = std::move(*record);
    entry->header.ring = RingSnapshot{};
    LOG_DEBUG_COMP_IF("Loaded named key " + name + " from storage", "Registry");
    return entry;
}

Result<std::shared_ptr<NamedKeyRegistry::Entry>> NamedKeyRegistry::lookup(const std::string& name) {
    if (name.empty()) {
        return Error{ErrorCode::InvalidInput, "missing name"};
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(name);
        if (it != entries_.end()) {
            return it->second;
        }
        if (pending_.count(name)) {
            return notFound(name);
        }
    }

    auto loaded = loadFromStore(name);
    if (!loaded) {
        return loaded.error();
    }

    std::lock_guard<std::mutex> lock(mutex_);
    // A create that started after the first check owns the name until it finishes
    if (pending_.count(name)) {
        return notFound(name);
    }
    auto inserted = entries_.emplace(name, *loaded);
    return inserted.first->second;
}

NamedKeyConfig NamedKeyRegistry::viewOf(const Entry& entry) {
    NamedKeyConfig config;
    config.name = entry.header.name;
    config.algorithm = entry.header.algorithm;
    config.rotationPeriod = entry.header.rotationPeriod;
    config.verificationTtl = entry.header.verificationTtl;
    config.keyRing = entry.ring->keyIds();
    config.signingKeyId = entry.ring->currentKeyId();
    return config;
}

Result<NamedKeyConfig> NamedKeyRegistry::get(const std::string& name) {
    auto entry = lookup(name);
    if (!entry) {
        return entry.error();
    }
    return viewOf(**entry);
}

Result<std::shared_ptr<KeyRing>> NamedKeyRegistry::keyRing(const std::string& name) {
    auto entry = lookup(name);
    if (!entry) {
        return entry.error();
    }
    return (*entry)->ring;
}

Result<NamedKeyConfig> NamedKeyRegistry::rotate(const std::string& name, const OperationContext& ctx) {
    auto entry = lookup(name);
    if (!entry) {
        return entry.error();
    }
    auto rotated = (*entry)->ring->rotate(ctx);
    if (!rotated) {
        return rotated.error();
    }
    return viewOf(**entry);
}

Result<size_t> NamedKeyRegistry::rotateIfDue(const OperationContext& ctx) {
    auto names = list();
    if (!names) {
        return names.error();
    }

    size_t rotated = 0;
    for (const auto& name : *names) {
        auto ring = keyRing(name);
        if (!ring && ring.error().code == ErrorCode::SerializationFailed) {
            LOG_WARN_COMP("Skipping unreadable named key " + name + ": " + ring.error().message, "Registry");
            continue;
        }
        if (!ring) {
            return ring.error();
        }
        auto due = (*ring)->rotateIfDue(ctx);
        if (!due) {
            return due.error();
        }
        if (*due) {
            ++rotated;
        }
    }
    return rotated;
}

Result<std::vector<std::string>> NamedKeyRegistry::list() {
    std::string prefix = defaults::NAMED_KEY_PREFIX;
    auto keys = store_->list(prefix);
    if (!keys) {
        return keys.error();
    }

    std::set<std::string> names;
    for (const auto& key : *keys) {
        names.insert(key.substr(prefix.size()));
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& entry : entries_) {
            names.insert(entry.first);
        }
    }
    return std::vector<std::string>(names.begin(), names.end());
}

} // namespace Signet

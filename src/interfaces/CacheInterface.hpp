#ifndef CACHEINTERFACE_HPP
#define CACHEINTERFACE_HPP

#include <optional>
#include <string>

// One cache tier. ttl is in seconds; 0 means the tier's default TTL.
// Values are copied in and out, so tiers never share an entry.
class CacheInterface {
public:
    virtual ~CacheInterface() = default;
    virtual bool set(const std::string& key, const std::string& value, int ttl = 0) = 0;
    virtual std::optional<std::string> get(const std::string& key) = 0;
    virtual bool remove(const std::string& key) = 0;
    virtual bool clear() = 0;
    virtual bool exists(const std::string& key) = 0;

    // Whole seconds left before key expires; nullopt when the key is absent
    // or the tier cannot tell.
    virtual std::optional<int> remainingTtl(const std::string& key) {
        (void)key;
        return std::nullopt;
    }
};

#endif // CACHEINTERFACE_HPP

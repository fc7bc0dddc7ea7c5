#pragma once

#include <functional>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>

namespace debug_mcp {

// Resource function signature
using ResourceFunction = std::function<std::string()>;

struct ResourceDescriptor {
    std::string uri;
    std::string name;
    std::string description;
    std::string mime_type;
};

struct ResourceContent {
    std::string uri;
    std::string mime_type;
    std::string text;
};

class UnknownResourceError : public std::runtime_error {
public:
    explicit UnknownResourceError(const std::string& uri)
        : std::runtime_error("Unknown resource: " + uri), uri_(uri) {}

    const std::string& uri() const { return uri_; }

private:
    std::string uri_;
};

class ResourceProvider {
public:
    // Throws std::logic_error on an empty or duplicate URI, a missing
    // function, or when called after seal().
    void add(const ResourceDescriptor& descriptor, ResourceFunction func);

    void seal() { sealed_ = true; }

    const std::vector<ResourceDescriptor>& list_resources() const { return descriptors_; }
    std::vector<std::string> uris() const;

    // Exact match on the URI. Throws UnknownResourceError.
    ResourceContent read(const std::string& uri) const;

private:
    std::vector<ResourceDescriptor> descriptors_;
    std::map<std::string, ResourceFunction> functions_;
    bool sealed_ = false;
};

} // namespace debug_mcp

#include <debugmcp/resource_provider.hpp>
#include <algorithm>

namespace debug_mcp {

void ResourceProvider::add(const ResourceDescriptor& descriptor, ResourceFunction func) {
    if (sealed_) {
        throw std::logic_error("Resource provider is sealed, cannot add: " + descriptor.uri);
    }
    if (descriptor.uri.empty()) {
        throw std::logic_error("Resource URI must not be empty");
    }
    if (!func) {
        throw std::logic_error("Resource has no content function: " + descriptor.uri);
    }
    if (functions_.count(descriptor.uri)) {
        throw std::logic_error("Resource already registered: " + descriptor.uri);
    }

    descriptors_.push_back(descriptor);
    functions_[descriptor.uri] = std::move(func);
}

std::vector<std::string> ResourceProvider::uris() const {
    std::vector<std::string> result;
    for (const auto& descriptor : descriptors_) {
        result.push_back(descriptor.uri);
    }
    return result;
}

ResourceContent ResourceProvider::read(const std::string& uri) const {
    auto func_it = functions_.find(uri);
    if (func_it == functions_.end()) {
        throw UnknownResourceError(uri);
    }

    auto desc_it = std::find_if(descriptors_.begin(), descriptors_.end(),
        [&uri](const ResourceDescriptor& d) { return d.uri == uri; });

    ResourceContent content;
    content.uri = uri;
    content.mime_type = desc_it->mime_type;
    content.text = func_it->second();
    return content;
}

} // namespace debug_mcp

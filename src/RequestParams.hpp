#pragma once
#include <string>
#include <unordered_map>

enum class Endpoint { Read, List };

// Query parameters of a /read or /list request, validated.
class RequestParams {
public:
    // Throws RequestError (400) for unknown keys or malformed values.
    static RequestParams extract(const std::unordered_map<std::string, std::string>& query, Endpoint endpoint);

    // An empty filter passes everything; "-text" passes entries without "text".
    bool filterAllows(const std::string& entry) const;

    const std::string& name() const { return name_; }
    const std::string& filterText() const { return filterText_; }
    bool filterOmit() const { return filterOmit_; }
    // Zero means no limit.
    long long count() const { return count_; }
    // "", "inline" or "attachment".
    const std::string& contentDisposition() const { return contentDisposition_; }

    void setName(const std::string& name) { name_ = name; }
    void setFilter(const std::string& filter);
    void setCount(long long count) { count_ = count > 0 ? count : 0; }

private:
    std::string name_;
    std::string filterText_;
    bool filterOmit_ = false;
    long long count_ = 0;
    std::string contentDisposition_;
};

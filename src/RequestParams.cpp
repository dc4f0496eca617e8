#include "RequestParams.hpp"
#include "RequestError.hpp"
#include <stdexcept>
#include <trantor/utils/Logger.h>

namespace {

const char* kParamContentDisposition = "content-disposition";
const char* kParamCount = "count";
const char* kParamFilter = "filter";
const char* kParamName = "name";

[[noreturn]] void reject(const std::string& message) {
    LOG_WARN << message;
    throw RequestError(400, message);
}

long long parseCount(const std::string& value) {
    if (value.empty()) {
        return 0;
    }
    std::size_t pos = 0;
    long long count = 0;
    try {
        count = std::stoll(value, &pos);
    } catch (const std::exception& e) {
        reject(std::string("Invalid conversion of param count=\"") + value + "\", " + e.what());
    }
    if (pos != value.size()) {
        reject(std::string("Invalid conversion of param count=\"") + value + "\"");
    }
    return count;
}

} // namespace

RequestParams RequestParams::extract(const std::unordered_map<std::string, std::string>& query, Endpoint endpoint) {
    RequestParams params;
    for (const auto& [key, value] : query) {
        if (key == kParamName) {
            params.setName(value);
        } else if (key == kParamFilter) {
            params.setFilter(value);
        } else if (endpoint == Endpoint::Read && key == kParamCount) {
            params.setCount(parseCount(value));
        } else if (endpoint == Endpoint::Read && key == kParamContentDisposition) {
            if (value != "" && value != "inline" && value != "attachment") {
                reject("Invalid value content-disposition=\"" + value + "\"");
            }
            params.contentDisposition_ = value;
        } else {
            reject("Parameter \"" + key + "\" invalid");
        }
    }
    return params;
}

void RequestParams::setFilter(const std::string& filter) {
    filterOmit_ = !filter.empty() && filter[0] == '-';
    filterText_ = filterOmit_ ? filter.substr(1) : filter;
}

bool RequestParams::filterAllows(const std::string& entry) const {
    if (filterText_.empty()) {
        return true;
    }
    if (entry.find(filterText_) != std::string::npos) {
        return !filterOmit_;
    }
    return filterOmit_;
}

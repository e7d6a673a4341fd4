#include "bulkget/http_client.hpp"

#include <algorithm>
#include <cctype>

namespace bulkget {

bool CaseInsensitiveLess::operator()(const std::string& lhs, const std::string& rhs) const {
    return std::lexicographical_compare(lhs.begin(), lhs.end(), rhs.begin(), rhs.end(),
                                        [](unsigned char a, unsigned char b) {
                                            return std::tolower(a) < std::tolower(b);
                                        });
}

std::optional<std::string> HttpResponseHead::header(const std::string& name) const {
    const auto it = headers.find(name);
    if (it == headers.end()) {
        return std::nullopt;
    }
    return it->second;
}

} // namespace bulkget

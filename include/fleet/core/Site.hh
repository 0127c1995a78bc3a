#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace fleet {

// A site acted upon by a site-scoped event. Global events carry none.
struct Site {
    int64_t id = 0;
    std::string name;
    std::string url;
    std::vector<int64_t> groups;

    bool inGroup(int64_t groupId) const;

    bool operator==(const Site&) const = default;
};

} // namespace fleet

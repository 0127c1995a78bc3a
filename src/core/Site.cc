#include "fleet/core/Site.hh"

#include <algorithm>

namespace fleet {

bool Site::inGroup(int64_t groupId) const {
    return std::find(groups.begin(), groups.end(), groupId) != groups.end();
}

} // namespace fleet

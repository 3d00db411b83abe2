#ifndef TIERFS_SRC_COMMON_IDS_HPP_
#define TIERFS_SRC_COMMON_IDS_HPP_

#include <string>

namespace TierFS::Common
{

/// Random (v4) UUID in canonical text form.
std::string NewUuid();

}  // namespace TierFS::Common

#endif  // TIERFS_SRC_COMMON_IDS_HPP_

#ifndef TIERFS_SRC_COMMON_OVERLOADED_HPP_
#define TIERFS_SRC_COMMON_OVERLOADED_HPP_

namespace TierFS::Common
{

/// Visitor built from a set of lambdas, for exhaustive std::visit.
template <class... Ts>
struct Overloaded : Ts... {
    using Ts::operator()...;
};
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

}  // namespace TierFS::Common

#endif  // TIERFS_SRC_COMMON_OVERLOADED_HPP_

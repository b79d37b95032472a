#include "eclear/clearing/intersection_solver.hpp"

#include <algorithm>

namespace eclear {
namespace clearing {

std::optional<ClearingPoint> solveIntersection(const DemandCurve& demand,
                                               const SupplyCurve& supply) {
  const auto& d = demand.points;
  const auto& s = supply.points;

  std::size_t i = 0;
  std::size_t j = 0;
  ClearingPoint point;

  while (i < d.size() && j < s.size() && d[i].price >= s[j].price) {
    point.quantity =
        std::min(d[i].cumulative_quantity, s[j].cumulative_quantity);
    point.price = s[j].price;

    if (d[i].cumulative_quantity < s[j].cumulative_quantity) {
      ++i;
    } else if (d[i].cumulative_quantity > s[j].cumulative_quantity) {
      ++j;
    } else {
      ++i;
      ++j;
    }
  }

  if (point.quantity == 0) {
    return std::nullopt;
  }
  return point;
}

}  // namespace clearing
}  // namespace eclear

#include "nbp/system_info.hpp"
#include "nbp/error.hpp"
#include "nbp/logging.hpp"

#include <algorithm>
#include <cmath>
#include <string>

namespace nbp {

SystemInfo::SystemInfo(double characteristic_length,
                       const std::vector<double>& sigmas,
                       double cutoff_factor,
                       double skin_factor) {
    NBP_CHECK_CONFIG(!sigmas.empty(), "at least one particle type sigma is required", "");
    for (double s : sigmas) {
        NBP_CHECK_CONFIG(std::isfinite(s) && s > 0.0,
                         "sigma must be finite and positive, got " + std::to_string(s), "");
    }
    NBP_CHECK_CONFIG(std::isfinite(characteristic_length) && characteristic_length > 0.0,
                     "characteristic length must be finite and positive", "");
    NBP_CHECK_CONFIG(cutoff_factor > 0.0, "cutoff factor must be positive", "");
    NBP_CHECK_CONFIG(skin_factor > cutoff_factor,
                     "skin factor " + std::to_string(skin_factor) +
                     " must exceed cutoff factor " + std::to_string(cutoff_factor),
                     "a skin radius equal to the cutoff leaves no drift margin between rebuilds");

    sigma_max_ = *std::max_element(sigmas.begin(), sigmas.end());
    cutoff_radius_ = cutoff_factor * sigma_max_;
    skin_radius_ = skin_factor * sigma_max_;
    box_length_ = std::ceil(characteristic_length / cutoff_radius_) * cutoff_radius_;

    NBP_CHECK_CONFIG(cutoff_radius_ <= box_length_ / 2.0,
                     "cutoff radius " + std::to_string(cutoff_radius_) +
                     " exceeds half the box length " + std::to_string(box_length_),
                     "increase the characteristic length or reduce sigma");

    LOG_DEBUG("SystemInfo: L=", box_length_, " cutoff=", cutoff_radius_,
              " skin=", skin_radius_, " sigma_max=", sigma_max_);
}

} // namespace nbp

#include "peakquant/CurveCost.hpp"
#include <stdexcept>
#include <string>

namespace peakquant {

CurveCost::CurveCost(const CompositeCurve& model,
                     const Vector&         x,
                     const Vector&         y)
    : model_(model)
    , x_(x)
    , y_(y)
{
    if (x_.size() != y_.size())
        throw std::invalid_argument(
            "CurveCost: x has " + std::to_string(x_.size()) +
            " samples but y has " + std::to_string(y_.size()));
}

void CurveCost::operator()(const Eigen::VectorXd& parameters,
                           Eigen::VectorXd*       residuals,
                           Eigen::MatrixXd*       jacobians) const
{
    if (residuals)
        *residuals = model_.evaluate(x_, parameters) - y_;

    if (!jacobians) return;                       // user wants resid only

    /* d r / d p  =  d model / d p */
    *jacobians = model_.jacobian(x_, parameters);
}

} // namespace peakquant

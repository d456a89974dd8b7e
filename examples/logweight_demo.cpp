#include "libgauss/rules/families.hpp"

#include <cmath>
#include <iostream>
#include <vector>

// Integrate f(x) x^rho log(1/x) over (0, 1) for a smooth f with growing rule sizes.
int main(){
    std::vector<double> rhos = {-0.5, 0.0, 1.0, 2.5};
    std::vector<int> sizes = {2, 4, 8, 16};
    // reference value from a 40-point rule
    auto f = [](double x) { return 1.0 / (1.0 + x); };

    std::cout.precision(15);
    for (double rho : rhos){
        const auto ref = gauss::logweight_real<double>(40, rho);
        double exact = 0.0;
        for (std::size_t j = 0; j < ref.size(); ++j) exact += ref.weights[j] * f(ref.nodes[j]);

        std::cout << "rho = " << rho << "  (40 points: " << exact << ")\n";
        std::cout << "  n    gauss error          radau(1) error\n";
        for (int n : sizes){
            const auto g = gauss::logweight_real<double>(n, rho);
            const auto r = gauss::logweight_real<double>(n, rho, gauss::EndPt::Right);
            double sg = 0.0, sr = 0.0;
            for (int j = 0; j < n; ++j){
                sg += g.weights[j] * f(g.nodes[j]);
                sr += r.weights[j] * f(r.nodes[j]);
            }
            std::cout << "  " << n << "    " << std::abs(sg - exact) << "    " << std::abs(sr - exact) << "\n";
        }
        std::cout << "\n";
    }
    return 0;
}

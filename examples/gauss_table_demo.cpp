#include "libgauss/core/errors.hpp"
#include "libgauss/rules/families.hpp"

#include <iomanip>
#include <iostream>
#include <limits>

int main(){
    int type, n;
    char endpt_choice;
    gauss::EndPt endpt = gauss::EndPt::Neither;
    gauss::family::Any<double> fam;

    std::cout << "Input  Weight\n";
    std::cout << "  1    Legendre\n";
    std::cout << "  2    Chebyshev (1st kind)\n";
    std::cout << "  3    Jacobi (alpha = 0.5, beta = -0.5)\n";
    std::cout << "  4    Laguerre (alpha = 0)\n";
    std::cout << "  5    Hermite\n";
    std::cout << "  6    x log(1/x)\n";
    while(true){
        std::cout << "> ";
        if (std::cin >> type && type >= 1 && type <= 6) break;
        std::cout << "Not a weight.\n";
        std::cin.clear();
        std::cin.ignore(std::numeric_limits<std::streamsize>::max(), '\n');
    }
    switch (type){
        case 1: fam = gauss::family::Legendre{}; break;
        case 2: fam = gauss::family::Chebyshev{1}; break;
        case 3: fam = gauss::family::Jacobi<double>{0.5, -0.5}; break;
        case 4: fam = gauss::family::Laguerre<double>{0.0}; break;
        case 5: fam = gauss::family::Hermite{}; break;
        default: fam = gauss::family::LogWeight{1}; break;
    }
    while(true){
        std::cout << "Number of points: ";
        if (std::cin >> n && n >= 1) break;
        std::cout << "Please input a positive integer.\n";
        std::cin.clear();
        std::cin.ignore(std::numeric_limits<std::streamsize>::max(), '\n');
    }
    while(true){
        std::cout << "Endpoints? (g)auss, (l)eft, (r)ight, (b)oth: ";
        if (std::cin >> endpt_choice && (endpt_choice == 'g' || endpt_choice == 'l'
                                         || endpt_choice == 'r' || endpt_choice == 'b')) break;
        std::cout << "Not an option.\n";
        std::cin.clear();
        std::cin.ignore(std::numeric_limits<std::streamsize>::max(), '\n');
    }
    if (endpt_choice == 'l') endpt = gauss::EndPt::Left;
    else if (endpt_choice == 'r') endpt = gauss::EndPt::Right;
    else if (endpt_choice == 'b') endpt = gauss::EndPt::Both;

    try {
        const auto q = gauss::rule<double>(fam, n, endpt);
        double total = 0.0;
        std::cout << std::setprecision(16);
        std::cout << "  j   node                     weight\n";
        for (std::size_t j = 0; j < q.size(); ++j){
            std::cout << std::setw(3) << j << "   " << std::setw(22) << q.nodes[j]
                      << "   " << std::setw(22) << q.weights[j] << "\n";
            total += q.weights[j];
        }
        std::cout << "Sum of weights: " << total << "\n";
    } catch (const gauss::InvalidDomain& e) {
        std::cout << "Invalid request: " << e.what() << "\n";
        return 1;
    } catch (const std::runtime_error& e) {
        std::cout << "Rule construction failed: " << e.what() << "\n";
        return 1;
    }
    return 0;
}

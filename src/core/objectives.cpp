#include "discolib/core/iproblem.hpp"
#include "discolib/core/errors.hpp"

using namespace discolib::core;

namespace {

    constexpr double PI = 3.14159265358979323846;

    // -(x - 5)^2, optimum 0 at x = 5
    class QuadraticObjective : public IObjective {
        public:
            std::string name() const override { return "quadratic"; }

            double evaluate(const TParameters& p) const override {
                double x = p.at("x");
                return -(x - 5.0) * (x - 5.0);
            }

            TParameters initialParameters() const override { return {{"x", 0.0}}; }

            TMutationBounds bounds() const override { return {{"x", {1.0, -50.0, 50.0}}}; }
    };

    // -sum (v - 1)^2 over x, y, z; optimum 0 at (1, 1, 1)
    class SphereObjective : public IObjective {
        public:
            std::string name() const override { return "sphere"; }

            double evaluate(const TParameters& p) const override {
                double sum = 0.0;
                for (const char* key : {"x", "y", "z"}) {
                    double d = p.at(key) - 1.0;
                    sum += d * d;
                }
                return -sum;
            }

            TParameters initialParameters() const override {
                return {{"x", -5.0}, {"y", 5.0}, {"z", 0.0}};
            }

            TMutationBounds bounds() const override {
                TMutationBound b{0.5, -10.0, 10.0};
                return {{"x", b}, {"y", b}, {"z", b}};
            }
    };

    // Negated 2-D Rastrigin, optimum 0 at the origin
    class RastriginObjective : public IObjective {
        public:
            std::string name() const override { return "rastrigin"; }

            double evaluate(const TParameters& p) const override {
                double sum = 20.0;
                for (const char* key : {"x", "y"}) {
                    double v = p.at(key);
                    sum += v * v - 10.0 * std::cos(2.0 * PI * v);
                }
                return -sum;
            }

            TParameters initialParameters() const override { return {{"x", 3.0}, {"y", -3.0}}; }

            TMutationBounds bounds() const override {
                TMutationBound b{0.3, -5.12, 5.12};
                return {{"x", b}, {"y", b}};
            }
    };

} // namespace

namespace discolib::core {

    std::shared_ptr<IObjective> createObjective(const std::string& name)
    {
        if (name == "quadratic") return std::make_shared<QuadraticObjective>();
        if (name == "sphere")    return std::make_shared<SphereObjective>();
        if (name == "rastrigin") return std::make_shared<RastriginObjective>();

        throw ConfigError("unknown objective '" + name + "'");
    }

    std::vector<std::string> objectiveNames()
    {
        return {"quadratic", "sphere", "rastrigin"};
    }

}

#include <boost/ut.hpp>

#include <deepeq/OverrideRegistry.hpp>

#include <atomic>
#include <cmath>
#include <string>
#include <thread>
#include <vector>

namespace deepeq::override_registry_test {

struct Angle {
    double degrees;
};

bool sameAngle(const Angle& lhs, const Angle& rhs) { return std::fmod(lhs.degrees - rhs.degrees, 360.0) == 0.0; }

const boost::ut::suite<"OverrideRegistry"> registryTests = [] {
    using namespace boost::ut;

    "register, lookup and invoke"_test = [] {
        OverrideRegistry registry;
        expect(registry.empty());
        expect(registry.lookup(TypeId(typeid(Angle))) == nullptr);

        registry.registerEquivalence<Angle>(sameAngle);
        expect(eq(registry.size(), 1UZ));
        expect(registry.contains<Angle>());
        expect(!registry.contains<double>());

        const auto predicate = registry.lookup(TypeId(typeid(Angle)));
        expect(fatal(predicate != nullptr));
        const Angle a{10.0};
        const Angle b{370.0};
        const Angle c{11.0};
        expect((*predicate)(&a, &b));
        expect(!(*predicate)(&a, &c));
    };

    "keyed by exact type"_test = [] {
        OverrideRegistry registry;
        registry.registerEquivalence<int>([](int, int) { return true; });
        expect(registry.contains<int>());
        expect(registry.contains<const int>()) << "cv-qualifiers do not form a distinct type";
        expect(!registry.contains<long>());
        expect(!registry.contains<unsigned int>());
    };

    "re-registration replaces the previous predicate"_test = [] {
        OverrideRegistry registry;
        registry.registerEquivalence<std::string>([](const std::string&, const std::string&) { return false; });
        registry.registerEquivalence<std::string>([](const std::string& lhs, const std::string& rhs) { return lhs.size() == rhs.size(); });
        expect(eq(registry.size(), 1UZ));

        const std::string x("abc");
        const std::string y("xyz");
        expect((*registry.lookup(TypeId(typeid(std::string))))(&x, &y));
    };

    "stateful predicates"_test = [] {
        OverrideRegistry registry;
        int              calls = 0;
        registry.registerEquivalence<Angle>([&calls](const Angle& lhs, const Angle& rhs) {
            ++calls;
            return sameAngle(lhs, rhs);
        });
        const Angle a{0.0};
        const auto  predicate = registry.lookup(TypeId(typeid(Angle)));
        expect((*predicate)(&a, &a));
        expect((*predicate)(&a, &a));
        expect(eq(calls, 2));
    };

    "unregister and clear"_test = [] {
        OverrideRegistry registry;
        registry.registerEquivalence<Angle>(sameAngle);
        registry.registerEquivalence<int>([](int lhs, int rhs) { return lhs % 2 == rhs % 2; });
        expect(registry.unregister<Angle>());
        expect(!registry.unregister<Angle>());
        expect(!registry.contains<Angle>());
        expect(eq(registry.size(), 1UZ));
        registry.clear();
        expect(registry.empty());
    };

    "a predicate looked up stays valid after its removal"_test = [] {
        OverrideRegistry registry;
        registry.registerEquivalence<Angle>(sameAngle);
        const auto predicate = registry.lookup(TypeId(typeid(Angle)));
        registry.clear();
        const Angle a{1.0};
        expect((*predicate)(&a, &a));
    };

    "copies are independent"_test = [] {
        OverrideRegistry original;
        original.registerEquivalence<Angle>(sameAngle);
        OverrideRegistry copy(original);
        copy.unregister<Angle>();
        expect(original.contains<Angle>());
        expect(!copy.contains<Angle>());

        copy = original;
        expect(copy.contains<Angle>());
    };

    "concurrent registration and lookup"_test = [] {
        OverrideRegistry         registry;
        std::atomic<bool>        stop{false};
        std::atomic<std::size_t> hits{0UZ};
        std::vector<std::thread> readers;
        for (int i = 0; i < 3; ++i) {
            readers.emplace_back([&] {
                const Angle a{0.0};
                while (!stop.load()) {
                    if (const auto predicate = registry.lookup(TypeId(typeid(Angle))); predicate && (*predicate)(&a, &a)) {
                        hits.fetch_add(1UZ);
                    }
                }
            });
        }
        std::vector<std::thread> writers;
        for (int i = 0; i < 2; ++i) {
            writers.emplace_back([&] {
                for (int n = 0; n < 1'000; ++n) {
                    registry.registerEquivalence<Angle>(sameAngle);
                    registry.registerEquivalence<int>([](int, int) { return true; });
                    registry.unregister<int>();
                }
            });
        }
        for (auto& writer : writers) {
            writer.join();
        }
        stop = true;
        for (auto& reader : readers) {
            reader.join();
        }
        expect(registry.contains<Angle>());
        expect(!registry.contains<int>());
    };
};

} // namespace deepeq::override_registry_test

int main() { /* tests are statically executed */ }

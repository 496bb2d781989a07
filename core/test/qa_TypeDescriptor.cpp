#include <boost/ut.hpp>

#include <deepeq/AnyValue.hpp>
#include <deepeq/TypeDescriptor.hpp>
#include <deepeq/formatter/TypeDescriptorFormatter.hpp>

#include <array>
#include <chrono>
#include <format>
#include <functional>
#include <list>
#include <map>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <tuple>
#include <unordered_map>
#include <variant>
#include <vector>

namespace deepeq::type_descriptor_test {

struct Sample {
    int                 id;
    std::string         label;
    std::vector<double> values;

    DEEPEQ_MAKE_REFLECTABLE(Sample, id, label, values);
};

struct TimedSample : Sample {
    std::chrono::nanoseconds timestamp;

    DEEPEQ_MAKE_REFLECTABLE(TimedSample, timestamp);
};

struct Tree {
    int                                value;
    std::vector<std::unique_ptr<Tree>> children;

    DEEPEQ_MAKE_REFLECTABLE(Tree, value, children);
};

struct Plain {
    int   a;
    float b;
};

struct NotCopyable {
    NotCopyable(const NotCopyable&) = delete;
};

using detail::kind_of;

static_assert(kind_of<int>() == Kind::Primitive);
static_assert(kind_of<double>() == Kind::Primitive);
static_assert(kind_of<Plain>() == Kind::Primitive); // trivially copyable without reflection
static_assert(kind_of<std::chrono::nanoseconds>() == Kind::Primitive);
static_assert(kind_of<void*>() == Kind::Primitive);
static_assert(kind_of<std::string>() == Kind::String);
static_assert(kind_of<std::string_view>() == Kind::String);
static_assert(kind_of<Sample>() == Kind::Struct);
static_assert(kind_of<std::pair<int, std::string>>() == Kind::Struct);
static_assert(kind_of<std::tuple<int, double, char>>() == Kind::Struct);
static_assert(kind_of<std::array<int, 3>>() == Kind::Array);
static_assert(kind_of<int[3]>() == Kind::Array);
static_assert(kind_of<std::span<const int, 3>>() == Kind::Array);
static_assert(kind_of<std::vector<int>>() == Kind::DynamicSequence);
static_assert(kind_of<std::span<const int>>() == Kind::DynamicSequence);
static_assert(kind_of<std::map<int, int>>() == Kind::AssociativeMap);
static_assert(kind_of<std::unordered_map<std::string, int>>() == Kind::AssociativeMap);
static_assert(kind_of<int*>() == Kind::Reference);
static_assert(kind_of<const char*>() == Kind::Reference);
static_assert(kind_of<std::shared_ptr<Sample>>() == Kind::Reference);
static_assert(kind_of<std::unique_ptr<Tree>>() == Kind::Reference);
static_assert(kind_of<std::reference_wrapper<int>>() == Kind::Reference);
static_assert(kind_of<std::reference_wrapper<const Sample>>() == Kind::Reference);
static_assert(kind_of<std::optional<int>>() == Kind::Polymorphic);
static_assert(kind_of<std::variant<int, std::string>>() == Kind::Polymorphic);
static_assert(kind_of<AnyValue>() == Kind::Polymorphic);
static_assert(kind_of<std::function<void()>>() == Kind::Callable);
static_assert(kind_of<int (*)(int)>() == Kind::Callable);

static_assert(Describable<Tree>);
static_assert(Describable<const Sample>);
static_assert(not Describable<std::vector<bool>>);
static_assert(not Describable<std::list<int>>);
static_assert(not Describable<NotCopyable>);
static_assert(not Describable<ValueRef>);

static_assert(isHardKind(Kind::Reference));
static_assert(isHardKind(Kind::DynamicSequence));
static_assert(isHardKind(Kind::AssociativeMap));
static_assert(isHardKind(Kind::Polymorphic));
static_assert(not isHardKind(Kind::Struct));
static_assert(not isHardKind(Kind::Array));
static_assert(not isHardKind(Kind::Primitive));

const boost::ut::suite<"TypeDescriptor"> descriptorTests = [] {
    using namespace boost::ut;
    using namespace std::string_view_literals;

    "descriptors are unique per type"_test = [] {
        expect(&descriptor_of<Sample>() == &descriptor_of<Sample>());
        expect(&descriptor_of<const Sample>() == &descriptor_of<Sample>());
        expect(descriptor_of<int>().id != descriptor_of<long>().id);
        expect(descriptor_of<std::int32_t>().id != descriptor_of<std::uint32_t>().id);
        expect(eq(descriptor_of<double>().size, sizeof(double)));
    };

    "struct fields in declaration order"_test = [] {
        const TypeDescriptor& type = descriptor_of<Sample>();
        expect(type.kind == Kind::Struct);
        expect(eq(type.fields.size(), 3UZ));
        expect(eq(type.fields[0].name, "id"sv));
        expect(eq(type.fields[1].name, "label"sv));
        expect(eq(type.fields[2].name, "values"sv));
        expect(type.fields[2].type().kind == Kind::DynamicSequence);

        Sample sample{7, "seven", {7.0}};
        expect(type.fields[1].address(&sample) == &sample.label);
    };

    "base class fields precede derived ones"_test = [] {
        const TypeDescriptor& type = descriptor_of<TimedSample>();
        expect(eq(type.fields.size(), 4UZ));
        expect(eq(type.fields[0].name, "id"sv));
        expect(eq(type.fields[3].name, "timestamp"sv));

        TimedSample sample{};
        expect(type.fields[0].address(&sample) == &sample.id);
        expect(type.fields[3].address(&sample) == &sample.timestamp);
    };

    "positional and pair fields"_test = [] {
        const TypeDescriptor& pair = descriptor_of<std::pair<int, std::string>>();
        expect(eq(pair.fields[0].name, "first"sv));
        expect(eq(pair.fields[1].name, "second"sv));

        const TypeDescriptor& tuple = descriptor_of<std::tuple<int, double, char>>();
        expect(eq(tuple.fields.size(), 3UZ));
        expect(eq(tuple.fields[2].name, "2"sv));
        expect(tuple.fields[1].type().id == TypeId(typeid(double)));
    };

    "recursive types resolve lazily"_test = [] {
        const TypeDescriptor& tree     = descriptor_of<Tree>();
        const TypeDescriptor& children = tree.fields[1].type();
        const TypeDescriptor& child    = children.sequence.elementType();
        expect(child.kind == Kind::Reference);
        expect(&child.reference.targetType() == &tree);
    };

    "sequence accessors"_test = [] {
        const std::array<int, 3> fixed{1, 2, 3};
        const TypeDescriptor&    arrayType = descriptor_of<std::array<int, 3>>();
        expect(eq(arrayType.sequence.length(&fixed), 3UZ));
        expect(arrayType.sequence.element(&fixed, 2UZ) == &fixed[2]);

        const int             raw[4] = {1, 2, 3, 4};
        const TypeDescriptor& rawType = descriptor_of<int[4]>();
        expect(eq(rawType.sequence.length(&raw), 4UZ));

        const std::vector<int> dynamic{4, 5};
        const TypeDescriptor&  vectorType = descriptor_of<std::vector<int>>();
        expect(eq(vectorType.sequence.length(&dynamic), 2UZ));
        expect(vectorType.sequence.storage(&dynamic) == dynamic.data());
        expect(!vectorType.sequence.isNil(&dynamic));

        const std::span<const int> nil;
        const std::span<const int> view(dynamic);
        const TypeDescriptor&      spanType = descriptor_of<std::span<const int>>();
        expect(spanType.sequence.isNil(&nil));
        expect(!spanType.sequence.isNil(&view));
    };

    "map accessors"_test = [] {
        const std::map<std::string, int> map{{"a", 1}, {"b", 2}};
        const TypeDescriptor&            type = descriptor_of<std::map<std::string, int>>();
        expect(eq(type.map.length(&map), 2UZ));

        const std::string present("b");
        const std::string absent("c");
        expect(type.map.find(&map, &present) == &map.at("b"));
        expect(type.map.find(&map, &absent) == nullptr);

        std::size_t visited = 0UZ;
        expect(type.map.forEach(&map, [&](const void*, const void*) { return ++visited < 10UZ; }));
        expect(eq(visited, 2UZ));
        expect(!type.map.forEach(&map, [](const void*, const void*) { return false; }));
    };

    "reference, polymorphic and callable accessors"_test = [] {
        int                   value  = 3;
        int*                  target = &value;
        int*                  null   = nullptr;
        const TypeDescriptor& ptr    = descriptor_of<int*>();
        expect(ptr.reference.target(&target) == &value);
        expect(ptr.reference.target(&null) == nullptr);

        const std::optional<int> some = 5;
        const std::optional<int> none;
        const TypeDescriptor&    optional = descriptor_of<std::optional<int>>();
        expect(optional.unwrap(&some).get_if<int>() == &*some);
        expect(!optional.unwrap(&none).valid());

        const std::variant<int, std::string> text = std::string("abc");
        expect(descriptor_of<std::variant<int, std::string>>().unwrap(&text).kind() == Kind::String);

        const std::function<void()> empty;
        const std::function<void()> full = [] {};
        const TypeDescriptor&       fn   = descriptor_of<std::function<void()>>();
        expect(fn.isEmpty(&empty));
        expect(!fn.isEmpty(&full));
    };

    "primitive bytes"_test = [] {
        const double          x    = 1.5;
        const TypeDescriptor& type = descriptor_of<double>();
        expect(eq(type.bytes(&x).size(), sizeof(double)));
        const std::monostate a{};
        const std::monostate b{};
        expect(descriptor_of<std::monostate>().bytes(&a).empty());
        expect(descriptor_of<std::monostate>().bytes(&b).empty());
    };
};

const boost::ut::suite<"ValueRef and AnyValue"> valueTests = [] {
    using namespace boost::ut;

    "ValueRef"_test = [] {
        const ValueRef none;
        expect(!none.valid());
        expect(none.kind() == Kind::Invalid);

        const Sample   sample{1, "one", {}};
        const ValueRef ref = ValueRef::of(sample);
        expect(ref.valid());
        expect(ref.kind() == Kind::Struct);
        expect(ref.get_if<Sample>() == &sample);
        expect(ref.get_if<TimedSample>() == nullptr);
    };

    "AnyValue"_test = [] {
        AnyValue empty;
        expect(empty.empty());
        expect(!empty.ref().valid());

        AnyValue number = 42;
        expect(!number.empty());
        expect(number.get_if<int>() != nullptr && *number.get_if<int>() == 42);
        expect(number.get_if<long>() == nullptr);

        AnyValue copy = number;
        expect(copy.get_if<int>() == number.get_if<int>()) << "copies share the held value";

        AnyValue text = std::string("abc");
        expect(text.type()->kind == Kind::String);

        expect(eq(std::format("{}", number.ref()), std::string("int32 [Primitive]")));
        expect(std::format("{:p}", number.ref()).starts_with("int32 [Primitive] @0x"));
        expect(eq(std::format("{}", ValueRef{}), std::string("<no value>")));
        expect(eq(std::format("{}", descriptor_of<Sample>()), std::format("{} [Struct]", descriptor_of<Sample>().name)));

        number.reset();
        expect(number.empty());
        expect(!copy.empty());
    };
};

} // namespace deepeq::type_descriptor_test

int main() { /* tests are statically executed */ }

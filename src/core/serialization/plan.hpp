/*
   Copyright 2025 The Bytewalk Authors

   Licensed under the Apache License, Version 2.0 (the "License");
   you may not use this file except in compliance with the License.
   You may obtain a copy of the License at

       http://www.apache.org/licenses/LICENSE-2.0

   Unless required by applicable law or agreed to in writing, software
   distributed under the License is distributed on an "AS IS" BASIS,
   WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
   See the License for the specific language governing permissions and
   limitations under the License.
*/

#pragma once
#include <functional>
#include <memory>
#include <string>
#include <tuple>
#include <type_traits>
#include <utility>
#include <vector>

#include <boost/noncopyable.hpp>

#include <core/serialization/context.hpp>
#include <core/serialization/errors.hpp>
#include <core/serialization/fields.hpp>
#include <core/serialization/serialize.hpp>
#include <core/serialization/shape.hpp>

namespace bytewalk::ser {

//! \brief An executable encode/decode procedure pair for one concrete type
//! \details A plan is built once by compile() and is immutable afterwards. Type dispatch and field lookup are
//! all resolved while compiling: executing a plan only runs the chain of closures built for the type.
template <class T>
class Plan : private boost::noncopyable {
  public:
    using Writer = std::function<outcome::result<void>(Context&, const T&)>;
    using Reader = std::function<outcome::result<T>(Context&)>;

    Plan(ShapePtr shape, Writer writer, Reader reader)
        : shape_{std::move(shape)},
          signature_{shape_->signature()},
          writer_{std::move(writer)},
          reader_{std::move(reader)} {}

    //! \brief Appends the encoding of value to the context's stream and relays its sequence lengths
    [[nodiscard]] outcome::result<void> write(Context& ctx, const T& value) const { return writer_(ctx, value); }

    //! \brief Decodes a value from the context's stream consuming the relayed sequence lengths
    [[nodiscard]] outcome::result<T> read(Context& ctx) const { return reader_(ctx); }

    [[nodiscard]] const Shape& shape() const noexcept { return *shape_; }
    [[nodiscard]] const std::string& signature() const noexcept { return signature_; }

  private:
    ShapePtr shape_;
    std::string signature_;
    Writer writer_;
    Reader reader_;
};

template <class T>
using PlanPtr = std::shared_ptr<const Plan<T>>;

template <class T>
outcome::result<PlanPtr<T>> compile(Trail& trail);

namespace detail {

    //! \brief Per field instructions of a record plan, in declared order
    template <class T>
    struct RecordSteps {
        std::vector<std::string> names;
        std::vector<std::function<outcome::result<void>(Context&, const T&)>> writers;
        std::vector<std::function<outcome::result<void>(Context&, T&)>> readers;
    };

    template <class T, class Owner, class Member>
    outcome::result<void> add_step(RecordSteps<T>& steps, const Field<Owner, Member>& field, Trail& trail) {
        const auto member_plan{compile<Member>(trail)};
        if (member_plan.has_error()) {
            trail.unwind(field.name);
            return member_plan.error();
        }
        const auto member{field.member};
        steps.names.emplace_back(field.name);
        steps.writers.emplace_back([plan = member_plan.value(), member](Context& ctx, const T& obj) {
            return plan->write(ctx, obj.*member);
        });
        steps.readers.emplace_back(
            [plan = member_plan.value(), member](Context& ctx, T& obj) -> outcome::result<void> {
                auto value{plan->read(ctx)};
                if (value.has_error()) return value.error();
                obj.*member = std::move(value.value());
                return outcome::success();
            });
        return outcome::success();
    }

    template <class T, class Owner, class Member>
    outcome::result<void> add_step(RecordSteps<T>&, const IgnoredField<Owner, Member>&, Trail&) {
        return outcome::success();
    }

    template <class T>
    outcome::result<std::pair<typename Plan<T>::Writer, typename Plan<T>::Reader>> build_sequence(Trail& trail) {
        using Element = typename T::value_type;
        const auto element_compiled{compile<Element>(trail)};
        if (element_compiled.has_error()) {
            trail.unwind("[]");
            return element_compiled.error();
        }
        const auto element_plan{element_compiled.value()};

        typename Plan<T>::Writer writer{[element_plan](Context& ctx, const T& seq) -> outcome::result<void> {
            if (const auto result{ctx.lengths().enqueue(seq.size())}; result.has_error()) return result.error();
            size_t index{0};
            for (const auto& element : seq) {
                if (const auto result{element_plan->write(ctx, element)}; result.has_error()) {
                    ctx.unwind(index);
                    return result.error();
                }
                ++index;
            }
            return outcome::success();
        }};

        typename Plan<T>::Reader reader{[element_plan](Context& ctx) -> outcome::result<T> {
            const auto count{ctx.next_count()};
            if (count.has_error()) return count.error();
            T ret{};
            if constexpr (FixedSequence<T>) {
                if (count.value() != std::tuple_size_v<T>) return Error::kExtentMismatch;
            } else {
                if constexpr (requires { ret.reserve(size_t{0}); }) ret.reserve(ctx.reserve_hint(count.value()));
            }
            for (size_t index{0}; index < count.value(); ++index) {
                auto element{element_plan->read(ctx)};
                if (element.has_error()) {
                    ctx.unwind(index);
                    return element.error();
                }
                if constexpr (FixedSequence<T>) {
                    ret[index] = std::move(element.value());
                } else {
                    ret.push_back(std::move(element.value()));
                }
            }
            return ret;
        }};
        return std::make_pair(std::move(writer), std::move(reader));
    }

    template <class T>
    outcome::result<std::pair<typename Plan<T>::Writer, typename Plan<T>::Reader>> build_record(Trail& trail) {
        auto steps{std::make_shared<RecordSteps<T>>()};
        outcome::result<void> status{outcome::success()};
        std::apply(
            [&](const auto&... field) {
                static_cast<void>(((status = add_step<T>(*steps, field, trail), status.has_value()) and ...));
            },
            Describe<T>::fields());
        if (status.has_error()) return status.error();
        const std::shared_ptr<const RecordSteps<T>> frozen{std::move(steps)};

        typename Plan<T>::Writer writer{[frozen](Context& ctx, const T& obj) -> outcome::result<void> {
            for (size_t i{0}; i < frozen->writers.size(); ++i) {
                if (const auto result{frozen->writers[i](ctx, obj)}; result.has_error()) {
                    ctx.unwind(frozen->names[i]);
                    return result.error();
                }
            }
            return outcome::success();
        }};

        typename Plan<T>::Reader reader{[frozen](Context& ctx) -> outcome::result<T> {
            T ret{};
            for (size_t i{0}; i < frozen->readers.size(); ++i) {
                if (const auto result{frozen->readers[i](ctx, ret)}; result.has_error()) {
                    ctx.unwind(frozen->names[i]);
                    return result.error();
                }
            }
            return ret;
        }};
        return std::make_pair(std::move(writer), std::move(reader));
    }

    //! \brief Pairs the shape of a supported type with its writer and reader
    template <class T>
    outcome::result<PlanPtr<T>> build_plan(ShapePtr shape, Trail& trail) {
        using enum ShapeKind;
        constexpr auto kind{shape_of_v<T>};
        typename Plan<T>::Writer writer;
        typename Plan<T>::Reader reader;
        if constexpr (kind == kPrimitive) {
            writer = [](Context& ctx, const T& value) { return write_data(ctx.stream(), value); };
            reader = [](Context& ctx) { return read_as<T>(ctx.stream()); };
        } else if constexpr (kind == kText) {
            writer = [](Context& ctx, const T& value) { return write_text(ctx.stream(), value); };
            reader = [](Context& ctx) { return read_text(ctx.stream()); };
        } else if constexpr (kind == kEnum) {
            using Underlying = std::underlying_type_t<T>;
            writer = [](Context& ctx, const T& value) {
                return write_data(ctx.stream(), static_cast<Underlying>(value));
            };
            reader = [](Context& ctx) -> outcome::result<T> {
                const auto value{read_as<Underlying>(ctx.stream())};
                if (value.has_error()) return value.error();
                return static_cast<T>(value.value());
            };
        } else if constexpr (kind == kSequence) {
            auto built{build_sequence<T>(trail)};
            if (built.has_error()) return built.error();
            std::tie(writer, reader) = std::move(built.value());
        } else if constexpr (kind == kRecord) {
            auto built{build_record<T>(trail)};
            if (built.has_error()) return built.error();
            std::tie(writer, reader) = std::move(built.value());
        }
        return std::make_shared<const Plan<T>>(std::move(shape), std::move(writer), std::move(reader));
    }

}  // namespace detail

//! \brief Builds the plan for a type
//! \details Recursively by shape:
//! - primitives, text and enums (as their underlying integral) make a single write/read instruction
//! - sequences relay their element count, then run the element plan once per element in iteration order
//! - records run the plan of every usable field in declared order; on read a default instance is populated
//! \remarks Compiling is free of side effects: it may be repeated for the same type and yield equivalent plans
template <class T>
outcome::result<PlanPtr<T>> compile(Trail& trail) {
    using enum ShapeKind;
    constexpr auto kind{shape_of_v<T>};
    auto shape{describe<T>(trail)};
    if (shape.has_error()) return shape.error();
    if constexpr (kind == kDynamic or kind == kUnsupported) {
        // Unreachable: describe() has already rejected these shapes
        return Error::kUnsupportedType;
    } else {
        return detail::build_plan<T>(std::move(shape.value()), trail);
    }
}

//! \brief Builds the plan for a type discarding the location of any failure
template <class T>
outcome::result<PlanPtr<T>> compile() {
    Trail trail;
    return compile<T>(trail);
}

}  // namespace bytewalk::ser

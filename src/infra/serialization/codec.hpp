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
#include <concepts>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

#include <core/common/base.hpp>
#include <core/serialization/base.hpp>
#include <core/serialization/context.hpp>
#include <core/serialization/direct.hpp>
#include <core/serialization/errors.hpp>
#include <core/serialization/length_queue.hpp>
#include <core/serialization/shape.hpp>
#include <core/serialization/stream.hpp>
#include <infra/common/log.hpp>
#include <infra/exceptions/serialization.hpp>
#include <infra/serialization/plan_cache.hpp>

namespace bytewalk::ser {

//! \brief The outcome of a top-level encode
//! \details data never holds sequence lengths nor type tags. The relayed lengths and the signature of the
//! encoded type travel alongside and must be handed back, untouched, to the matching decode.
struct Payload {
    Bytes data{};
    LengthQueue lengths{};
    std::string signature{};

    bool operator==(const Payload& other) const = default;
};

namespace detail {

    //! \brief Decode side checks once the top-level value has been read
    inline outcome::result<void> check_consumed(Context& ctx) {
        if (not ctx.lengths().empty()) return Error::kLengthQueueNotDrained;
        if (not ctx.settings().allow_trailing_data and not ctx.stream().eof()) return Error::kTrailingData;
        return outcome::success();
    }

    template <class T>
    outcome::result<Payload> encode(const T& value, Strategy strategy, const Settings& settings, Trail& trail) {
        ByteStream stream(settings.max_stream_size);
        LengthQueue lengths(settings.max_sequence_count);
        Context ctx(stream, lengths, settings, trail);

        std::string signature;
        if (strategy == Strategy::kDirect) {
            const auto shape{describe<T>(trail)};
            if (shape.has_error()) return shape.error();
            if (const auto result{direct::write(ctx, *shape.value(), &value)}; result.has_error()) {
                return result.error();
            }
            signature = shape.value()->signature();
        } else {
            const auto plan{PlanCache::instance().get_or_build<T>(trail)};
            if (plan.has_error()) return plan.error();
            if (const auto result{plan.value()->write(ctx, value)}; result.has_error()) return result.error();
            signature = plan.value()->signature();
        }
        return Payload{stream.release(), std::move(lengths), std::move(signature)};
    }

    template <class T>
        requires std::default_initializable<T>
    outcome::result<T> decode(ByteView data, LengthQueue lengths, std::string_view signature, Strategy strategy,
                              const Settings& settings, Trail& trail) {
        if (data.is_null() or (data.empty() and lengths.empty())) return Error::kInvalidArgument;
        if (data.size() > settings.max_stream_size) return Error::kInputTooLarge;
        ByteStream stream(data, settings.max_stream_size);
        Context ctx(stream, lengths, settings, trail);

        const bool verify{settings.verify_signature and not signature.empty()};
        T ret{};
        if (strategy == Strategy::kDirect) {
            const auto shape{describe<T>(trail)};
            if (shape.has_error()) return shape.error();
            if (verify and shape.value()->signature() != signature) return Error::kShapeMismatch;
            if (const auto result{direct::read(ctx, *shape.value(), &ret)}; result.has_error()) {
                return result.error();
            }
        } else {
            const auto plan{PlanCache::instance().get_or_build<T>(trail)};
            if (plan.has_error()) return plan.error();
            if (verify and plan.value()->signature() != signature) return Error::kShapeMismatch;
            auto value{plan.value()->read(ctx)};
            if (value.has_error()) return value.error();
            ret = std::move(value.value());
        }
        if (const auto result{check_consumed(ctx)}; result.has_error()) return result.error();
        return ret;
    }

    template <class T>
    outcome::result<Payload> serialize(const T& value, Strategy strategy, const Settings& settings, Trail& trail) {
        auto ret{encode(value, strategy, settings, trail)};
        if (ret.has_error()) {
            LOG_DEBUG << "Encode failed" << log::Tag{"type", type_name<T>()} << log::Tag{"error", ret.error().message()}
                      << log::Tag{"path", trail.path()};
        }
        return ret;
    }

    template <class T>
        requires std::default_initializable<T>
    outcome::result<T> deserialize(ByteView data, LengthQueue lengths, std::string_view signature,
                                   Strategy strategy, const Settings& settings, Trail& trail) {
        auto ret{decode<T>(data, std::move(lengths), signature, strategy, settings, trail)};
        if (ret.has_error()) {
            LOG_DEBUG << "Decode failed" << log::Tag{"type", type_name<T>()} << log::Tag{"error", ret.error().message()}
                      << log::Tag{"path", trail.path()};
        }
        return ret;
    }

}  // namespace detail

//! \brief Encodes a value into a payload
//! \remarks Failures leave no partial output behind
template <class T>
    requires(not std::is_pointer_v<T>)
outcome::result<Payload> try_serialize(const T& value, Strategy strategy = Strategy::kCompiled,
                                       const Settings& settings = {}) {
    Trail trail;
    return detail::serialize(value, strategy, settings, trail);
}

template <class T>
outcome::result<Payload> try_serialize(const T* value, Strategy strategy = Strategy::kCompiled,
                                       const Settings& settings = {}) {
    if (value == nullptr) return Error::kInvalidArgument;
    return try_serialize(*value, strategy, settings);
}

//! \brief Decodes a payload produced by a serialize call for the same type
//! \remarks When the payload carries a signature and settings.verify_signature is set a payload encoded for a
//! differently shaped type is rejected with kShapeMismatch before anything is read
template <class T>
    requires std::default_initializable<T>
outcome::result<T> try_deserialize(const Payload& payload, Strategy strategy = Strategy::kCompiled,
                                   const Settings& settings = {}) {
    Trail trail;
    return detail::deserialize<T>(payload.data, payload.lengths, payload.signature, strategy, settings, trail);
}

//! \brief Decodes raw bytes along with the lengths relayed by the matching encode
//! \warning Nothing identifies the encoded type here: bytes encoded for a type with the same wire layout but
//! a different field order decode without errors into swapped values
template <class T>
    requires std::default_initializable<T>
outcome::result<T> try_deserialize(ByteView data, LengthQueue lengths, Strategy strategy = Strategy::kCompiled,
                                   const Settings& settings = {}) {
    Trail trail;
    return detail::deserialize<T>(data, std::move(lengths), {}, strategy, settings, trail);
}

//! \brief Encodes a value into a payload
//! \throws ser::Exception carrying the failing field path
template <class T>
    requires(not std::is_pointer_v<T>)
Payload serialize(const T& value, Strategy strategy = Strategy::kCompiled, const Settings& settings = {}) {
    Trail trail;
    auto ret{detail::serialize(value, strategy, settings, trail)};
    if (ret.has_error()) throw Exception(ret.error(), type_name<T>(), trail.path());
    return std::move(ret.value());
}

template <class T>
Payload serialize(const T* value, Strategy strategy = Strategy::kCompiled, const Settings& settings = {}) {
    if (value == nullptr) throw Exception(make_error_code(Error::kInvalidArgument), type_name<T>(), {});
    return serialize(*value, strategy, settings);
}

template <class T>
    requires std::default_initializable<T>
T deserialize(const Payload& payload, Strategy strategy = Strategy::kCompiled, const Settings& settings = {}) {
    Trail trail;
    auto ret{detail::deserialize<T>(payload.data, payload.lengths, payload.signature, strategy, settings, trail)};
    if (ret.has_error()) throw Exception(ret.error(), type_name<T>(), trail.path());
    return std::move(ret.value());
}

template <class T>
    requires std::default_initializable<T>
T deserialize(ByteView data, LengthQueue lengths, Strategy strategy = Strategy::kCompiled,
              const Settings& settings = {}) {
    Trail trail;
    auto ret{detail::deserialize<T>(data, std::move(lengths), {}, strategy, settings, trail)};
    if (ret.has_error()) throw Exception(ret.error(), type_name<T>(), trail.path());
    return std::move(ret.value());
}

}  // namespace bytewalk::ser

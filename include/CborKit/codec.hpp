#pragma once

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <type_traits>

#include "decoder.hpp"
#include "encoder.hpp"
#include "errors.hpp"
#include "result.hpp"

namespace CborKit {

namespace codec_details {
struct primary_codec {};
}

// Customization point. Specialize for a type to take over its wire form:
//
//   template<> struct CborKit::Codec<Point> {
//       template<class Enc, class Ctx>
//       static constexpr bool encode(const Point& p, Enc& e, Ctx& ctx);
//       template<class Ctx>
//       static constexpr bool decode(Point& p, Decoder& d, Ctx& ctx);
//   };
//
// Both functions report failure by returning ctx.withEncoderError(e) /
// ctx.withDecoderError(d) (or ctx.withError(...)).
template <class T>
struct Codec : codec_details::primary_codec {};

template <class T>
concept HasCustomCodec = !std::is_base_of_v<codec_details::primary_codec, Codec<T>>;

template <class UserCtx = void>
class EncodeContext {
    EncodeError error_ = EncodeError::NO_ERROR;
    UserCtx* user_ = nullptr;
    error_path path_;

public:
    using user_context_type = UserCtx;

    constexpr explicit EncodeContext(UserCtx* user = nullptr) : user_(user) {}

    constexpr UserCtx* user() const { return user_; }
    constexpr EncodeError error() const { return error_; }
    constexpr const error_path& path() const { return path_; }

    template<class Enc>
    constexpr bool withEncoderError(Enc& enc) {
        if (error_ == EncodeError::NO_ERROR) {
            error_ = enc.getError() == EncodeError::NO_ERROR ? EncodeError::CUSTOM_CODEC_ERROR : enc.getError();
        }
        return false;
    }

    template<class Enc>
    constexpr bool withError(EncodeError err, Enc& enc) {
        if (error_ == EncodeError::NO_ERROR) {
            error_ = err;
        }
        enc.fail(err);
        return false;
    }

    class PathGuard {
        EncodeContext* ctx_;
    public:
        constexpr PathGuard(EncodeContext& ctx, PathElement e) : ctx_(&ctx) {
            ctx_->path_.push(e);
        }
        PathGuard(const PathGuard&) = delete;
        PathGuard& operator=(const PathGuard&) = delete;
        constexpr ~PathGuard() {
            if (ctx_->error_ == EncodeError::NO_ERROR) ctx_->path_.pop();
        }
        constexpr void at(std::uint64_t value) { ctx_->path_.setTop(value); }
    };

    constexpr PathGuard enter(PathElement e) {
        return PathGuard(*this, e);
    }

    template<class Enc>
    constexpr EncodeResult result(const Enc& enc) const {
        return EncodeResult(error_, enc.bytesWritten(), path_);
    }
};

template <class UserCtx = void>
class DecodeContext {
    DecodeError error_ = DecodeError::NO_ERROR;
    std::size_t offset_ = 0;
    std::uint64_t detail_ = 0;
    std::size_t depth_remaining_;
    UserCtx* user_ = nullptr;
    error_path path_;

public:
    using user_context_type = UserCtx;

    constexpr explicit DecodeContext(std::size_t max_depth, UserCtx* user = nullptr)
        : depth_remaining_(max_depth), user_(user)
    {}

    constexpr UserCtx* user() const { return user_; }
    constexpr DecodeError error() const { return error_; }
    constexpr std::uint64_t detail() const { return detail_; }
    constexpr std::size_t depthRemaining() const { return depth_remaining_; }
    constexpr const error_path& path() const { return path_; }

    template<class Dec>
    constexpr bool withDecoderError(const Dec& d) {
        if (error_ == DecodeError::NO_ERROR) {
            error_  = d.getError() == DecodeError::NO_ERROR ? DecodeError::CUSTOM_CODEC_ERROR : d.getError();
            offset_ = d.position();
        }
        return false;
    }

    template<class Dec>
    constexpr bool withError(DecodeError err, const Dec& d, std::uint64_t detail = 0) {
        if (error_ == DecodeError::NO_ERROR) {
            error_  = err;
            offset_ = d.position();
            detail_ = detail;
        }
        return false;
    }

    // One nested container, tag or struct level. Converts to false when the
    // depth budget is exhausted.
    class DepthGuard {
        DecodeContext* ctx_;
        bool entered_;
    public:
        constexpr DepthGuard(DecodeContext& ctx, bool entered) : ctx_(&ctx), entered_(entered) {}
        DepthGuard(const DepthGuard&) = delete;
        DepthGuard& operator=(const DepthGuard&) = delete;
        constexpr ~DepthGuard() {
            if (!entered_) return;
            ++ctx_->depth_remaining_;
            if (ctx_->error_ == DecodeError::NO_ERROR) ctx_->path_.pop();
        }
        constexpr explicit operator bool() const { return entered_; }
        constexpr void at(std::uint64_t value) { ctx_->path_.setTop(value); }
    };

    constexpr DepthGuard enter(PathElement e) {
        if (depth_remaining_ == 0) {
            return DepthGuard(*this, false);
        }
        --depth_remaining_;
        path_.push(e);
        return DepthGuard(*this, true);
    }

    // Saved state for abandoning a failed attempt (variant probing, tolerated
    // unknown variants in optional fields).
    struct Snapshot {
        std::size_t path_depth = 0;
    };

    constexpr Snapshot snapshot() const {
        return Snapshot{path_.depth()};
    }

    constexpr void restore(const Snapshot& s) {
        error_  = DecodeError::NO_ERROR;
        detail_ = 0;
        offset_ = 0;
        path_.truncate(s.path_depth);
    }

    constexpr DecodeResult result(std::size_t end_offset) const {
        return DecodeResult(error_, error_ == DecodeError::NO_ERROR ? end_offset : offset_, detail_, path_);
    }
};

namespace codec_details {

template<class T>
struct is_encode_context : std::false_type {};
template<class U>
struct is_encode_context<EncodeContext<U>> : std::true_type {};

template<class T>
struct is_decode_context : std::false_type {};
template<class U>
struct is_decode_context<DecodeContext<U>> : std::true_type {};

} // namespace codec_details

template<class C>
concept EncodeContextLike = codec_details::is_encode_context<std::remove_cvref_t<C>>::value;

template<class C>
concept DecodeContextLike = codec_details::is_decode_context<std::remove_cvref_t<C>>::value;

// Codec<T> specializations usable with the default encoder / decoder and no
// user context.
template <class T>
concept HasCustomEncode = HasCustomCodec<T>
    && requires(const T& v, Encoder<std::uint8_t*, std::uint8_t*>& e, EncodeContext<>& ctx) {
        { Codec<T>::encode(v, e, ctx) } -> std::same_as<bool>;
    };

template <class T>
concept HasCustomDecode = HasCustomCodec<T>
    && requires(T& v, Decoder& d, DecodeContext<>& ctx) {
        { Codec<T>::decode(v, d, ctx) } -> std::same_as<bool>;
    };

} // namespace CborKit

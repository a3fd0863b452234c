#include <qpricer/norm_cdf_unit.hpp>

#include <qpricer/reference.hpp>

namespace qpricer {

namespace {
constexpr std::int32_t kStep = std::int32_t{1} << NormalCdfUnit::kStepShift;
constexpr std::int32_t kLowerRaw = -NormalCdfUnit::kLimit * (std::int32_t{1} << kFracBits);
constexpr std::int32_t kUpperRaw = NormalCdfUnit::kLimit * (std::int32_t{1} << kFracBits);
}

NormalCdfUnit::NormalCdfUnit() {
    for (std::size_t i = 0; i < kEntries; ++i) {
        const double x = Fixed::from_raw(kLowerRaw + static_cast<std::int32_t>(i) * kStep).to_real();
        table_[i] = Fixed::from_real(reference::normal_cdf(x));
    }
}

void NormalCdfUnit::reset() {
    state_ = State::Idle;
    d1_ = Fixed{};
    d2_ = Fixed{};
    nd1_ = Fixed{};
}

Fixed NormalCdfUnit::evaluate(Fixed x) const {
    if (x.raw() <= kLowerRaw) {
        return table_.front();
    }
    if (x.raw() >= kUpperRaw) {
        return table_.back();
    }
    const std::int32_t offset = x.raw() - kLowerRaw;
    const auto index = static_cast<std::size_t>(offset >> kStepShift);
    const std::int64_t frac = offset & (kStep - 1);
    const std::int64_t lo = table_[index].raw();
    const std::int64_t hi = table_[index + 1].raw();
    return Fixed::saturate(lo + (((hi - lo) * frac) >> kStepShift));
}

NormalCdfPort::Outputs NormalCdfUnit::tick(const Inputs& in) {
    Outputs out;

    switch (state_) {
    case State::Idle:
        if (in.start) {
            d1_ = in.d1;
            d2_ = in.d2;
            state_ = State::EvalD1;
        }
        break;

    case State::EvalD1:
        nd1_ = evaluate(d1_);
        state_ = State::EvalD2;
        break;

    case State::EvalD2:
        state_ = State::Idle;
        out.status.done = true;
        out.status.valid = true;
        out.nd1 = nd1_;
        out.nd2 = evaluate(d2_);
        return out;
    }

    out.status.busy = state_ != State::Idle;
    return out;
}

} // namespace qpricer

#include "function_registry.hpp"

#include "errors.hpp"

#include <cmath>
#include <complex>
#include <vector>

namespace calc {

namespace {
constexpr double kZeroRate = 1e-9;
constexpr double kTolerance = 1e-7;
constexpr double kFlatDerivative = 1e-10;
constexpr int kMaxIterations = 100;

// Аргументы аннуитета: ставка, период, сумма, [платёж/сумма], [тип]
struct AnnuityArguments {
    Complex first;
    Complex second;
    Complex third;
    Complex fourth;
    double type = 0.0;
};

AnnuityArguments annuityArguments(const Arguments& arguments, const std::string& name) {
    if (arguments.size() < 3 || arguments.size() > 5) {
        throw EngineError::argumentMismatch(name, 3);
    }
    AnnuityArguments result;
    result.first = arguments[0].toComplex();
    result.second = arguments[1].toComplex();
    result.third = arguments[2].toComplex();
    if (arguments.size() >= 4) {
        result.fourth = arguments[3].toComplex();
    }
    if (arguments.size() == 5) {
        result.type = static_cast<double>(saturatingInt(arguments[4].toComplex().real()));
    }
    return result;
}

// fv(rate, nper, pv, [pmt], [type])
Number futureValue(const Arguments& arguments) {
    auto [rate, periods, present, payment, type] = annuityArguments(arguments, "fv");
    if (std::abs(rate) < kZeroRate) {
        return Number(-(present + payment * periods));
    }
    const Complex one(1.0, 0.0);
    Complex factor = std::pow(one + rate, periods);
    Complex paymentTerm = (payment * (one + rate * type)) * ((factor - one) / rate);
    return Number(-(present * factor + paymentTerm));
}

// pv(rate, nper, fv, [pmt], [type])
Number presentValue(const Arguments& arguments) {
    auto [rate, periods, future, payment, type] = annuityArguments(arguments, "pv");
    if (std::abs(rate) < kZeroRate) {
        return Number(-(future + payment * periods));
    }
    const Complex one(1.0, 0.0);
    Complex factor = std::pow(one + rate, periods);
    Complex paymentTerm = (payment * (one + rate * type)) * ((factor - one) / rate);
    return Number(-(future + paymentTerm) / factor);
}

// pmt(rate, nper, pv, [fv], [type])
Number payment(const Arguments& arguments) {
    auto [rate, periods, present, future, type] = annuityArguments(arguments, "pmt");
    if (std::abs(rate) < kZeroRate) {
        return Number(-(future + present) / periods);
    }
    const Complex one(1.0, 0.0);
    Complex factor = std::pow(one + rate, periods);
    Complex numerator = (present * factor + future) * rate;
    Complex denominator = (one + rate * type) * (factor - one);
    return Number(-(numerator / denominator));
}

// nper(rate, pmt, pv, [fv], [type])
Number periodCount(const Arguments& arguments) {
    auto [rate, paymentValue, present, future, type] = annuityArguments(arguments, "nper");
    if (std::abs(rate) < kZeroRate) {
        return Number(-(future + present) / paymentValue);
    }
    const Complex one(1.0, 0.0);
    Complex adjusted = one + rate * type;
    Complex numerator = paymentValue * adjusted - future * rate;
    Complex denominator = paymentValue * adjusted + present * rate;
    return Number(std::log(numerator / denominator) / std::log(one + rate));
}

// npv(rate, v1, v2, ...): каждый член дисконтируется независимо
Number netPresentValue(const Arguments& arguments) {
    if (arguments.size() < 2) {
        throw EngineError::argumentMismatch("npv", 2);
    }
    const Complex one(1.0, 0.0);
    Complex rate = arguments[0].toComplex();
    Complex sum;
    for (std::size_t i = 1; i < arguments.size(); ++i) {
        sum += arguments[i].toComplex() / std::pow(one + rate, static_cast<double>(i));
    }
    return Number(sum);
}

// Метод Ньютона по вещественным частям потока платежей
Number internalRateOfReturn(const Arguments& arguments) {
    std::vector<double> values;
    values.reserve(arguments.size());
    for (const auto& argument : arguments) {
        values.push_back(argument.toComplex().real());
    }

    double guess = 0.1;
    for (int iteration = 0; iteration < kMaxIterations; ++iteration) {
        double npv = 0.0;
        double derivative = 0.0;
        for (std::size_t i = 0; i < values.size(); ++i) {
            double t = static_cast<double>(i);
            npv += values[i] / std::pow(1.0 + guess, t);
            if (i > 0) {
                derivative -= t * values[i] / std::pow(1.0 + guess, t + 1.0);
            }
        }
        if (std::abs(npv) < kTolerance) {
            return Number(Complex(guess, 0.0));
        }
        if (std::abs(derivative) < kFlatDerivative) {
            break;
        }
        guess -= npv / derivative;
    }
    return Number(Complex(guess, 0.0));
}

double annuityBalance(double rate, double periods, double paymentValue,
                      double present, double future, double type) {
    double factor = std::pow(1.0 + rate, periods);
    double paymentTerm = (paymentValue * (1.0 + rate * type)) * ((factor - 1.0) / rate);
    return present * factor + paymentTerm + future;
}

// rate(nper, pmt, pv, [fv], [type], [guess]): метод секущих с шагом 1e-5
Number interestRate(const Arguments& arguments) {
    if (arguments.size() < 3) {
        throw EngineError::argumentMismatch("rate", 3);
    }
    auto realAt = [&arguments](std::size_t index, double fallback) {
        return index < arguments.size() ? arguments[index].toComplex().real() : fallback;
    };
    double periods = realAt(0, 0.0);
    double paymentValue = realAt(1, 0.0);
    double present = realAt(2, 0.0);
    double future = realAt(3, 0.0);
    double type = static_cast<double>(saturatingInt(realAt(4, 0.0)));
    double guess = realAt(5, 0.1);

    const double delta = 1e-5;
    for (int iteration = 0; iteration < kMaxIterations; ++iteration) {
        if (std::abs(guess) < kZeroRate) {
            if (std::abs(present + paymentValue * periods + future) < kTolerance) {
                return Number(Complex(0.0, 0.0));
            }
            guess = 0.0001;
            continue;
        }
        double y = annuityBalance(guess, periods, paymentValue, present, future, type);
        double shifted = annuityBalance(guess + delta, periods, paymentValue, present, future, type);
        double derivative = (shifted - y) / delta;
        if (std::abs(derivative) < kFlatDerivative) {
            break;
        }
        double next = guess - y / derivative;
        if (std::abs(next - guess) < kTolerance) {
            return Number(Complex(next, 0.0));
        }
        guess = next;
    }
    return Number(Complex(guess, 0.0));
}
}

void registerFinancialFunctions(FunctionRegistry& registry) {
    registry.add("fv", futureValue);
    registry.add("pv", presentValue);
    registry.add("pmt", payment);
    registry.add("nper", periodCount);
    registry.add("npv", netPresentValue);
    registry.add("irr", internalRateOfReturn);
    registry.add("rate", interestRate);
}

} // namespace calc

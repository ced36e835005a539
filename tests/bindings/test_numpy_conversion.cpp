/// @file tests/bindings/test_numpy_conversion.cpp
/// @brief Tests for NumPy argument conversion used by the processing bindings.

#include <gtest/gtest.h>
#include <pybind11/embed.h>
#include "numpy_conversion.hpp"
#include "thermolog/processing/steady_state.hpp"

#include <memory>
#include <vector>

namespace py = pybind11;
using namespace thermolog;
using bindings::ContiguousArray;
using bindings::to_vector;

class NumpyConversionTest : public ::testing::Test {
protected:
    static void SetUpTestSuite() {
        if (!interpreter_) {
            interpreter_ = std::make_unique<py::scoped_interpreter>();
        }
    }

    void SetUp() override {
        try {
            numpy_ = py::module_::import("numpy");
        } catch (const py::error_already_set& e) {
            GTEST_SKIP() << "numpy unavailable: " << e.what();
        }
    }

    /// Evaluate a NumPy expression and convert it the way a bound argument is
    std::vector<double> convert(const char* expression) {
        py::dict scope;
        scope["np"] = numpy_;
        py::object value = py::eval(expression, scope);
        return to_vector(value.cast<ContiguousArray>());
    }

    static std::unique_ptr<py::scoped_interpreter> interpreter_;
    py::module_ numpy_;
};

std::unique_ptr<py::scoped_interpreter> NumpyConversionTest::interpreter_;

TEST_F(NumpyConversionTest, ContiguousArray_CopiedAsIs) {
    EXPECT_EQ(convert("np.arange(4.0)"), (std::vector<double>{0, 1, 2, 3}));
}

TEST_F(NumpyConversionTest, ReversedView_ReadInLogicalOrder) {
    EXPECT_EQ(convert("np.arange(7.0)[::-1]"),
              (std::vector<double>{6, 5, 4, 3, 2, 1, 0}));
}

TEST_F(NumpyConversionTest, SteppedView_TakesSelectedSamples) {
    EXPECT_EQ(convert("np.arange(7.0)[::2]"), (std::vector<double>{0, 2, 4, 6}));
}

TEST_F(NumpyConversionTest, IntegerInput_CastToFloat) {
    EXPECT_EQ(convert("np.array([50, 50, 90], dtype=np.int32)"),
              (std::vector<double>{50, 50, 90}));
}

TEST_F(NumpyConversionTest, ReversedFrequency_SegmentsLikeForwardCopy) {
    SteadyStateSegmenter segmenter(2.0);
    // Reversed: 90 90 90 50 50 50 50
    auto frequency = convert("np.array([50.0, 50, 50, 50, 90, 90, 90])[::-1]");
    EXPECT_EQ(segmenter.run_lengths(frequency), (std::vector<size_t>{3, 4}));
}

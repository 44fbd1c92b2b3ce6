#include "inverse_core/inverse_core.hpp"
#include "inverse_core/detail/gauss_jordan.hpp"

#include "test_util.hpp"

#include <cassert>
#include <cmath>
#include <cstring>
#include <limits>

using inverse_core::Error;
using inverse_core::ErrorCode;
using inverse_core::InversionOutcome;
using inverse_core::InversionResult;
using inverse_core::Matrix;
using inverse_core::MatrixView;
using inverse_core::OpLog;
using inverse_core::RowOp;
using inverse_core::RowOpKind;
using inverse_core::WorkingMatrix;
using inverse_test::max_abs_diff;
using inverse_test::near;

static void expect_op(const RowOp& op, RowOpKind kind, std::uint8_t target, std::uint8_t source, double factor) {
		assert(op.kind() == kind);
		assert(op.target_row() == target);
		assert(op.source_row() == source);
		assert(near(op.factor(), factor));
}

static Matrix product(MatrixView a, MatrixView b) {
		Matrix out;
		assert(inverse_core::matrix_init(a.rows, b.cols, &out) == ErrorCode::Ok);
		assert(inverse_core::matrix_mul(a, b, out.mut_view()) == ErrorCode::Ok);
		return out;
}

int main() {
		// [[4,7],[2,6]]: |4| > |2| so no swap, every step follows partial pivoting
		{
				const Matrix a = inverse_test::mat2(4, 7, 2, 6);
				InversionResult res;
				Error err = inverse_core::op_inverse(a.view(), &res);
				assert(inverse_core::is_ok(err));
				assert(res.outcome == InversionOutcome::Inverted);
				assert(res.inverted() && !res.singular());

				assert(res.inverse.rows == 2 && res.inverse.cols == 2);
				assert(near(res.inverse.at(0, 0), 0.6, 1e-12));
				assert(near(res.inverse.at(0, 1), -0.7, 1e-12));
				assert(near(res.inverse.at(1, 0), -0.2, 1e-12));
				assert(near(res.inverse.at(1, 1), 0.4, 1e-12));
				assert(near(res.determinant, 10.0, 1e-12));

				inverse_test::print_log(res.log);
				assert(res.log.size() == 4);
				expect_op(res.log[0], RowOpKind::Scale, 0, 0, 0.25);
				expect_op(res.log[1], RowOpKind::AddMul, 1, 0, -2.0);
				expect_op(res.log[2], RowOpKind::Scale, 1, 1, 0.4);
				expect_op(res.log[3], RowOpKind::AddMul, 0, 1, -1.75);
				assert(res.log.count(RowOpKind::Swap) == 0);

				assert(std::strcmp(res.log[0].description(), "R1 <- (0.2500) R1") == 0);
				assert(std::strcmp(res.log[1].description(), "R2 <- R2 + (-2) R1") == 0);
				assert(std::strcmp(res.log[2].description(), "R2 <- (0.4000) R2") == 0);
				assert(std::strcmp(res.log[3].description(), "R1 <- R1 + (-1.7500) R2") == 0);
		}

		// [[1,2],[3,4]]: larger pivot below the diagonal forces a swap
		{
				const Matrix a = inverse_test::mat2(1, 2, 3, 4);
				InversionResult res;
				assert(inverse_core::is_ok(inverse_core::op_inverse(a.view(), &res)));
				assert(res.inverted());

				assert(res.log.size() == 5);
				expect_op(res.log[0], RowOpKind::Swap, 0, 1, 0.0);
				expect_op(res.log[1], RowOpKind::Scale, 0, 0, 1.0 / 3.0);
				expect_op(res.log[2], RowOpKind::AddMul, 1, 0, -1.0);
				expect_op(res.log[3], RowOpKind::Scale, 1, 1, 1.5);
				expect_op(res.log[4], RowOpKind::AddMul, 0, 1, -4.0 / 3.0);
				assert(std::strcmp(res.log[0].description(), "R1 <-> R2") == 0);

				assert(near(res.inverse.at(0, 0), -2.0, 1e-12));
				assert(near(res.inverse.at(0, 1), 1.0, 1e-12));
				assert(near(res.inverse.at(1, 0), 1.5, 1e-12));
				assert(near(res.inverse.at(1, 1), -0.5, 1e-12));
				assert(near(res.determinant, -2.0, 1e-12));
		}

		// pivoting always takes the largest magnitude, even with a usable diagonal
		{
				const double v[] = {
								1, 0, 0,
								0, 1, 0,
								-5, 0, 1,
				};
				const Matrix a = inverse_test::make_matrix(3, 3, v);
				InversionResult res;
				assert(inverse_core::is_ok(inverse_core::op_inverse(a.view(), &res)));
				assert(res.inverted());
				expect_op(res.log[0], RowOpKind::Swap, 0, 2, 0.0);
				expect_op(res.log[1], RowOpKind::Scale, 0, 0, -0.2);
				assert(near(res.determinant, 1.0, 1e-12));
		}

		// singular: second row is twice the first. the log stops at the failing column
		{
				const Matrix a = inverse_test::mat2(1, 2, 2, 4);
				InversionResult res;
				Error err = inverse_core::op_inverse(a.view(), &res);
				assert(inverse_core::is_ok(err));
				assert(res.outcome == InversionOutcome::Singular);
				assert(res.singular_col == 1);
				assert(res.determinant == 0.0);

				assert(res.log.size() == 3);
				expect_op(res.log[0], RowOpKind::Swap, 0, 1, 0.0);
				expect_op(res.log[1], RowOpKind::Scale, 0, 0, 0.5);
				expect_op(res.log[2], RowOpKind::AddMul, 1, 0, -1.0);
		}

		// singular: identical rows, scale by 1 is still logged
		{
				const Matrix a = inverse_test::mat2(1, 2, 1, 2);
				InversionResult res;
				assert(inverse_core::is_ok(inverse_core::op_inverse(a.view(), &res)));
				assert(res.singular());
				assert(res.singular_col == 1);
				assert(res.log.size() == 2);
				expect_op(res.log[0], RowOpKind::Scale, 0, 0, 1.0);
				expect_op(res.log[1], RowOpKind::AddMul, 1, 0, -1.0);
		}

		// singular: zero row and zero column
		{
				const double zero_row[] = {
								1, 2, 3,
								0, 0, 0,
								4, 5, 6,
				};
				Matrix a = inverse_test::make_matrix(3, 3, zero_row);
				InversionResult res;
				assert(inverse_core::is_ok(inverse_core::op_inverse(a.view(), &res)));
				assert(res.singular());

				const double zero_col[] = {
								0, 2, 3,
								0, 5, 6,
								0, 8, 10,
				};
				a = inverse_test::make_matrix(3, 3, zero_col);
				assert(inverse_core::is_ok(inverse_core::op_inverse(a.view(), &res)));
				assert(res.singular());
				assert(res.singular_col == 0);
				assert(res.log.empty());
		}

		// identity: one scale per column, nothing else
		{
				const Matrix a = inverse_test::identity(3);
				InversionResult res;
				assert(inverse_core::is_ok(inverse_core::op_inverse(a.view(), &res)));
				assert(res.inverted());
				assert(res.log.size() == 3);
				assert(res.log.count(RowOpKind::Scale) == 3);
				for (const RowOp& op : res.log)
						assert(op.factor() == 1.0);
				assert(max_abs_diff(res.inverse.view(), a.view()) == 0.0);
				assert(res.determinant == 1.0);
		}

		// permutation matrix: determinant sign follows the swaps
		{
				const Matrix a = inverse_test::mat2(0, 1, 1, 0);
				InversionResult res;
				assert(inverse_core::is_ok(inverse_core::op_inverse(a.view(), &res)));
				assert(res.inverted());
				assert(res.log.count(RowOpKind::Swap) == 1);
				assert(res.log.count(RowOpKind::AddMul) == 0);
				assert(near(res.determinant, -1.0));
				assert(max_abs_diff(res.inverse.view(), a.view()) == 0.0);
		}

		// identity law and round trip across every supported size
		for (std::uint8_t n = inverse_core::kMinDim; n <= inverse_core::kMaxDim; n++) {
				for (std::uint32_t seed = 1; seed <= 3; seed++) {
						const Matrix a = inverse_test::dominant(n, seed * 7919u + n);
						InversionResult res;
						assert(inverse_core::is_ok(inverse_core::op_inverse(a.view(), &res)));
						assert(res.inverted());
						assert(res.log.size() <= inverse_core::kMaxRowOps);

						const Matrix id = inverse_test::identity(n);
						const Matrix left = product(a.view(), res.inverse.view());
						const Matrix right = product(res.inverse.view(), a.view());
						assert(max_abs_diff(left.view(), id.view()) < 1e-9);
						assert(max_abs_diff(right.view(), id.view()) < 1e-9);

						InversionResult back;
						assert(inverse_core::is_ok(inverse_core::op_inverse(res.inverse.view(), &back)));
						assert(back.inverted());
						assert(max_abs_diff(back.inverse.view(), a.view()) < 1e-6);
						assert(near(back.determinant * res.determinant, 1.0, 1e-6));
				}
		}

		// boundary sizes: 1x1 and 11x11 are rejected, 2x3 is not square
		{
				double buf[11 * 11];
				for (double& v : buf)
						v = 1.0;

				InversionResult res;
				Error err = inverse_core::op_inverse(MatrixView{1, 1, 1, buf}, &res);
				assert(err.code == ErrorCode::InvalidDimension);
				assert(err.a.rows == 1 && err.a.cols == 1);
				assert(res.outcome == InversionOutcome::None);
				assert(res.log.empty());

				err = inverse_core::op_inverse(MatrixView{11, 11, 11, buf}, &res);
				assert(err.code == ErrorCode::InvalidDimension);

				err = inverse_core::op_inverse(MatrixView{2, 3, 3, buf}, &res);
				assert(err.code == ErrorCode::InvalidDimension);
				assert(err.a.rows == 2 && err.a.cols == 3);
		}

		// non finite entries are rejected with their position, and clear a previous result
		{
				Matrix a = inverse_test::mat2(4, 7, 2, 6);
				InversionResult res;
				assert(inverse_core::is_ok(inverse_core::op_inverse(a.view(), &res)));
				assert(!res.log.empty());

				a.at_mut(1, 0) = std::numeric_limits<double>::quiet_NaN();
				Error err = inverse_core::op_inverse(a.view(), &res);
				assert(err.code == ErrorCode::InvalidValue);
				assert(err.i == 1 && err.j == 0);
				assert(res.outcome == InversionOutcome::None);
				assert(res.log.empty());

				a.at_mut(1, 0) = 2.0;
				a.at_mut(0, 1) = -std::numeric_limits<double>::infinity();
				err = inverse_core::op_inverse(a.view(), &res);
				assert(err.code == ErrorCode::InvalidValue);
				assert(err.i == 0 && err.j == 1);

				assert(inverse_core::op_inverse(a.view(), nullptr).code == ErrorCode::Internal);
		}

		// the caller's matrix is never touched
		{
				const double v[] = {
								2, 1, 1,
								1, 3, 2,
								1, 0, 0,
				};
				double raw[9];
				std::memcpy(raw, v, sizeof(raw));
				InversionResult res;
				assert(inverse_core::is_ok(inverse_core::op_inverse(MatrixView{3, 3, 3, raw}, &res)));
				assert(res.inverted());
				assert(std::memcmp(raw, v, sizeof(raw)) == 0);
		}

		// replaying the log on [A | I] reproduces the engine's working matrix exactly
		{
				const double v[] = {
								0, 2, 1, 4,
								3, -1, 2, 0,
								1, 1, 1, 1,
								-2, 0, 5, 3,
				};
				const Matrix a = inverse_test::make_matrix(4, 4, v);

				WorkingMatrix aug;
				assert(inverse_core::is_ok(WorkingMatrix::initialize(a.view(), &aug)));
				OpLog log;
				inverse_core::detail::EliminationReport report;
				assert(inverse_core::detail::gauss_jordan(aug, log, &report) == ErrorCode::Ok);
				assert(!report.singular);
				assert(log.count(RowOpKind::Swap) >= 1);

				WorkingMatrix replayed;
				assert(inverse_core::is_ok(inverse_core::replay_log(a.view(), log, log.size(), &replayed)));
				for (std::uint8_t r = 0; r < aug.n(); r++) {
						for (std::uint8_t c = 0; c < aug.cols(); c++)
								assert(replayed.at(r, c) == aug.at(r, c));
				}

				// and matches what op_inverse hands out
				InversionResult res;
				assert(inverse_core::is_ok(inverse_core::op_inverse(a.view(), &res)));
				assert(res.log.size() == log.size());
				assert(max_abs_diff(res.inverse.view(), replayed.right()) == 0.0);
				assert(near(res.determinant, report.determinant, 0.0));

				// replaying nothing gives back [A | I]
				assert(inverse_core::is_ok(inverse_core::replay_log(a.view(), log, 0, &replayed)));
				assert(max_abs_diff(replayed.left(), a.view()) == 0.0);
				assert(max_abs_diff(replayed.right(), inverse_test::identity(4).view()) == 0.0);

				Error err = inverse_core::replay_log(a.view(), log, log.size() + 1, &replayed);
				assert(err.code == ErrorCode::StepOutOfRange);
		}

		// a partial log from a singular matrix replays to the state at the failure
		{
				const Matrix a = inverse_test::mat2(1, 2, 2, 4);
				InversionResult res;
				assert(inverse_core::is_ok(inverse_core::op_inverse(a.view(), &res)));
				assert(res.singular());

				WorkingMatrix replayed;
				assert(inverse_core::is_ok(inverse_core::replay_log(a.view(), res.log, res.log.size(), &replayed)));
				assert(near(replayed.at(1, 0), 0.0));
				assert(near(replayed.at(1, 1), 0.0));
		}

		// a log whose rows do not fit the matrix cannot be replayed
		{
				OpLog log;
				assert(log.record(RowOp::swap(0, 2)) == ErrorCode::Ok);
				const Matrix a = inverse_test::mat2(1, 0, 0, 1);
				WorkingMatrix replayed;
				Error err = inverse_core::replay_log(a.view(), log, 1, &replayed);
				assert(err.code == ErrorCode::IndexOutOfRange);
		}

		// ill conditioned but invertible: still a success
		{
				const Matrix a = inverse_test::mat2(1, 1, 1, 1 + 1e-9);
				InversionResult res;
				assert(inverse_core::is_ok(inverse_core::op_inverse(a.view(), &res)));
				assert(res.inverted());
		}

		return 0;
}

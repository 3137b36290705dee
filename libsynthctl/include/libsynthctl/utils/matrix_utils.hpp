#pragma once

#include "libsynthctl/core/errors.hpp"
#include <Eigen/Dense>
#include <string>
#include <vector>

namespace libsynthctl {
namespace utils {

/**
 * Coerce a list of rows into a dense matrix
 *
 * @param rows Row-major values, every row of equal length
 * @param name Argument name used in the error message
 * @throws InvalidArgumentError (NOT_A_MATRIX) if rows have different lengths
 */
inline Eigen::MatrixXd ToMatrix(const std::vector<std::vector<double>> &rows, const std::string &name) {
	const size_t n_rows = rows.size();
	const size_t n_cols = n_rows == 0 ? 0 : rows.front().size();

	Eigen::MatrixXd matrix(static_cast<Eigen::Index>(n_rows), static_cast<Eigen::Index>(n_cols));
	for (size_t i = 0; i < n_rows; i++) {
		if (rows[i].size() != n_cols) {
			throw InvalidArgumentError(InvalidArgumentCause::NOT_A_MATRIX,
			                           name + " is not coercible to a matrix (row " + std::to_string(i) + " has " +
			                               std::to_string(rows[i].size()) + " values, expected " +
			                               std::to_string(n_cols) + ")");
		}
		for (size_t j = 0; j < n_cols; j++) {
			matrix(static_cast<Eigen::Index>(i), static_cast<Eigen::Index>(j)) = rows[i][j];
		}
	}
	return matrix;
}

/**
 * Population variance (divisor n) of each column
 */
inline Eigen::VectorXd ColumnVariances(const Eigen::MatrixXd &X) {
	const Eigen::RowVectorXd means = X.colwise().mean();
	return (X.rowwise() - means).array().square().colwise().mean().transpose().matrix();
}

} // namespace utils
} // namespace libsynthctl

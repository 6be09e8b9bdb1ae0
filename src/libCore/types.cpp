#include "core/types.hpp"

namespace c4 {

const char* toString(const MoveResult result) {
	switch (result) {
	case MoveResult::Ok:
		return "Ok";
	case MoveResult::InvalidColumn:
		return "InvalidColumn";
	case MoveResult::ColumnFull:
		return "ColumnFull";
	case MoveResult::InvalidState:
		return "InvalidState";
	}
	return "Unknown";
}

} // namespace c4

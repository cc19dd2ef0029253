#include "type_descriptor.h"

namespace {

struct PrimitiveEntry {
	PrimitiveKind kind;
	char code;
	const char* name;
};

const PrimitiveEntry kPrimitives[] = {
	{PrimitiveKind::Void,    'V', "void"},
	{PrimitiveKind::Boolean, 'Z', "boolean"},
	{PrimitiveKind::Byte,    'B', "byte"},
	{PrimitiveKind::Char,    'C', "char"},
	{PrimitiveKind::Short,   'S', "short"},
	{PrimitiveKind::Int,     'I', "int"},
	{PrimitiveKind::Long,    'J', "long"},
	{PrimitiveKind::Float,   'F', "float"},
	{PrimitiveKind::Double,  'D', "double"},
};

const PrimitiveEntry& entryFor(PrimitiveKind kind) {
	// Table order follows the enum
	return kPrimitives[static_cast<int>(kind)];
}

} // namespace

char primitiveCode(PrimitiveKind kind) {
	return entryFor(kind).code;
}

const char* primitiveName(PrimitiveKind kind) {
	return entryFor(kind).name;
}

bool primitiveFromName(const std::string& name, PrimitiveKind* kind) {
	for (const PrimitiveEntry& entry : kPrimitives) {
		if (name == entry.name) {
			*kind = entry.kind;
			return true;
		}
	}
	return false;
}

bool primitiveFromCode(char code, PrimitiveKind* kind) {
	for (const PrimitiveEntry& entry : kPrimitives) {
		if (code == entry.code) {
			*kind = entry.kind;
			return true;
		}
	}
	return false;
}

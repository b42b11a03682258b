#pragma once

#include <cstdint>

// Constants from ECMA-335 (Partition II) used by the reader, the locator and the encoder.
namespace ilweave::ecma {

// CIL opcodes (single byte forms only)
namespace op {
constexpr static uint8_t kLdnull = 0x14;
constexpr static uint8_t kLdcI4_0 = 0x16;
constexpr static uint8_t kRet = 0x2A;
constexpr static uint8_t kConvI8 = 0x6A;
constexpr static uint8_t kConvR4 = 0x6B;
constexpr static uint8_t kConvR8 = 0x6C;
constexpr static uint8_t kConvI = 0xD3;
}  // namespace op

// Method body header (II.25.4)
constexpr static uint8_t kTinyFormat = 0x2;
constexpr static uint8_t kFatFormat = 0x3;
constexpr static uint8_t kFormatMask = 0x3;
constexpr static uint16_t kFatMoreSects = 0x8;
constexpr static uint16_t kFatFlagsMask = 0x0FFF;

// Element types (II.23.1.16)
namespace et {
constexpr static uint8_t kVoid = 0x01;
constexpr static uint8_t kBoolean = 0x02;
constexpr static uint8_t kChar = 0x03;
constexpr static uint8_t kI1 = 0x04;
constexpr static uint8_t kU1 = 0x05;
constexpr static uint8_t kI2 = 0x06;
constexpr static uint8_t kU2 = 0x07;
constexpr static uint8_t kI4 = 0x08;
constexpr static uint8_t kU4 = 0x09;
constexpr static uint8_t kI8 = 0x0A;
constexpr static uint8_t kU8 = 0x0B;
constexpr static uint8_t kR4 = 0x0C;
constexpr static uint8_t kR8 = 0x0D;
constexpr static uint8_t kString = 0x0E;
constexpr static uint8_t kPtr = 0x0F;
constexpr static uint8_t kByRef = 0x10;
constexpr static uint8_t kValueType = 0x11;
constexpr static uint8_t kClass = 0x12;
constexpr static uint8_t kArray = 0x14;
constexpr static uint8_t kGenericInst = 0x15;
constexpr static uint8_t kI = 0x18;
constexpr static uint8_t kU = 0x19;
constexpr static uint8_t kFnPtr = 0x1B;
constexpr static uint8_t kObject = 0x1C;
constexpr static uint8_t kSzArray = 0x1D;
constexpr static uint8_t kCModReqd = 0x1F;
constexpr static uint8_t kCModOpt = 0x20;
}  // namespace et

// Signature calling convention byte (II.23.2.1)
constexpr static uint8_t kSigHasThis = 0x20;
constexpr static uint8_t kSigGeneric = 0x10;
constexpr static uint8_t kSigKindMask = 0x0F;

// MethodAttributes (II.23.1.10)
constexpr static uint16_t kMethodStatic = 0x0010;

// Metadata table ids (II.22)
namespace table {
constexpr static uint8_t kModule = 0x00;
constexpr static uint8_t kTypeRef = 0x01;
constexpr static uint8_t kTypeDef = 0x02;
constexpr static uint8_t kFieldPtr = 0x03;
constexpr static uint8_t kField = 0x04;
constexpr static uint8_t kMethodPtr = 0x05;
constexpr static uint8_t kMethodDef = 0x06;
constexpr static uint8_t kParam = 0x08;
constexpr static uint8_t kModuleRef = 0x1A;
constexpr static uint8_t kTypeSpec = 0x1B;
constexpr static uint8_t kAssemblyRef = 0x23;
constexpr static uint8_t kCount = 64;
}  // namespace table

// #~ HeapSizes bits
constexpr static uint8_t kHeapStringsWide = 0x01;
constexpr static uint8_t kHeapGuidWide = 0x02;
constexpr static uint8_t kHeapBlobWide = 0x04;
constexpr static uint8_t kHeapExtraData = 0x40;

constexpr static uint32_t kMetadataSignature = 0x424A5342;  // "BSJB"
constexpr static uint16_t kDosSignature = 0x5A4D;           // "MZ"
constexpr static uint32_t kPeSignature = 0x00004550;        // "PE\0\0"
constexpr static uint16_t kPe32Magic = 0x10B;
constexpr static uint16_t kPe32PlusMagic = 0x20B;
constexpr static uint32_t kCliHeaderDirectory = 14;

}  // namespace ilweave::ecma

#include "interpreter.hpp"
#include "charset.hpp"
#include "error.hpp"
#include <cctype>
#include <cmath>
#include <iomanip>
#include <stdexcept>
#include <utility>

namespace bbcx {

namespace {

const Word ONE = Word::wrapInteger(1);
const Word ZERO = Word::wrapInteger(0);

// Fixed so that runs are reproducible.
constexpr std::mt19937::result_type RANDOM_SEED = 5489u;

Word floatResult(FloatType value)
{
    return Word::fromFloat(value);
}

Word bitwiseOr(const Word& lhs, const Word& rhs) { return lhs | rhs; }
Word bitwiseXor(const Word& lhs, const Word& rhs) { return lhs ^ rhs; }
Word bitwiseAnd(const Word& lhs, const Word& rhs) { return lhs & rhs; }
Word add(const Word& lhs, const Word& rhs) { return lhs + rhs; }
Word subtract(const Word& lhs, const Word& rhs) { return lhs - rhs; }
Word multiply(const Word& lhs, const Word& rhs) { return lhs * rhs; }
Word divide(const Word& lhs, const Word& rhs) { return lhs / rhs; }
Word power(const Word& lhs, const Word& rhs) { return lhs.power(rhs); }

} // namespace

// Indexed by function code.
const std::array<Interpreter::Handler, FUNCTION_COUNT> Interpreter::HANDLERS = {
    // 00: NIL OR NEQV AND ADD SUBT MULT DVD
    &Interpreter::execNil,
    &Interpreter::execAccumulate<bitwiseOr>,
    &Interpreter::execAccumulate<bitwiseXor>,
    &Interpreter::execAccumulate<bitwiseAnd>,
    &Interpreter::execAccumulate<add>,
    &Interpreter::execAccumulate<subtract>,
    &Interpreter::execAccumulate<multiply>,
    &Interpreter::execAccumulate<divide>,
    // 10: TAKE TSTR TNEG TNOT TTYP TTYZ TTTT TOUT
    &Interpreter::execTake,
    &Interpreter::execTstr,
    &Interpreter::execTneg,
    &Interpreter::execTnot,
    &Interpreter::execTtyp,
    &Interpreter::execTtyz,
    &Interpreter::execUnsupported,
    &Interpreter::execTout,
    // 20: SKIP SKAE SKAN SKET SKAL SKAG SKED SKEI
    &Interpreter::execSkip,
    &Interpreter::execSkae,
    &Interpreter::execSkan,
    &Interpreter::execSket,
    &Interpreter::execSkal,
    &Interpreter::execSkag,
    &Interpreter::execSked,
    &Interpreter::execSkei,
    // 30: SHL ROT DSHL DROT POWR DMULT DIV DDIV
    &Interpreter::execShift<&Word::shiftLeft>,
    &Interpreter::execShift<&Word::rotateLeft>,
    &Interpreter::execDoubleShift<&DoubleWord::shiftLeft>,
    &Interpreter::execDoubleShift<&DoubleWord::rotateLeft>,
    &Interpreter::execAccumulate<power>,
    &Interpreter::execDoubleArithmetic<&DoubleWord::multiply>,
    &Interpreter::execAccumulate<divide>,
    &Interpreter::execDoubleArithmetic<&DoubleWord::divide>,
    // 40: NILX ORX NEQVX ANDX ADDX SUBTX MULTX DVDX
    &Interpreter::execNilx,
    &Interpreter::execAccumulateAndSwap<bitwiseOr>,
    &Interpreter::execAccumulateAndSwap<bitwiseXor>,
    &Interpreter::execAccumulateAndSwap<bitwiseAnd>,
    &Interpreter::execAccumulateAndSwap<add>,
    &Interpreter::execAccumulateAndSwap<subtract>,
    &Interpreter::execAccumulateAndSwap<multiply>,
    &Interpreter::execAccumulateAndSwap<divide>,
    // 50: PUT PSQU PNEG PNOT PTYP PTYZ PFFP PIN
    &Interpreter::execPut,
    &Interpreter::execPsqu,
    &Interpreter::execPneg,
    &Interpreter::execPnot,
    &Interpreter::execPtyp,
    &Interpreter::execPtyz,
    &Interpreter::execUnsupported,
    &Interpreter::execPin,
    // 60: JUMP JEZ JNZ JAT JLZ JGZ JZD JZI
    &Interpreter::execJump,
    &Interpreter::execJez,
    &Interpreter::execJnz,
    &Interpreter::execUnsupported,
    &Interpreter::execJlz,
    &Interpreter::execJgz,
    &Interpreter::execUnsupported,
    &Interpreter::execUnsupported,
    // 70: DECR INCR MOCKP MOCKS DBYTE UNUSED EXEC EXTRA
    &Interpreter::execDecr,
    &Interpreter::execIncr,
    &Interpreter::execUnsupported,
    &Interpreter::execUnsupported,
    &Interpreter::execUnsupported,
    &Interpreter::execUnsupported,
    &Interpreter::execUnsupported,
    &Interpreter::execExtra,
};

Interpreter::Interpreter(Image image, std::istream& in, std::ostream& out)
    : store(image.memory), pc(image.entry), input(in), output(out), random(RANDOM_SEED)
{
}

bool Interpreter::halted() const
{
    return stopped || !Memory::contains(static_cast<IntType>(pc)) || !store[pc].isInstruction();
}

std::size_t Interpreter::run(std::size_t maxSteps)
{
    while (!halted()) {
        if (maxSteps != 0 && executed >= maxSteps)
            throw Error(ErrorKind::StepLimitExceeded,
                        "stopped after " + std::to_string(executed) + " instructions").at(pc);
        step();
    }
    return executed;
}

bool Interpreter::step()
{
    if (halted())
        return false;

    const Location at = pc;
    const Instruction instruction = Instruction::decode(store[at]);
    ++pc;
    try {
        (this->*HANDLERS[static_cast<std::size_t>(instruction.function)])(instruction);
    } catch (const Error& e) {
        pc = at;
        throw e.at(at);
    }
    ++executed;

    if (traceStream)
        trace(at, instruction);
    return true;
}

// =============================================================================
// OPERAND RESOLUTION
// =============================================================================

Location Interpreter::effectiveAddress(const Instruction& instruction) const
{
    IntType address = instruction.address;
    if (instruction.indirect)
        address = Instruction::decode(store.at(address)).address;
    if (instruction.indexRegister != 0)
        address += store.indexRegister(instruction.indexRegister).toInteger();
    if (!Memory::contains(address))
        throw Error(ErrorKind::InvalidOperand, "effective address " + std::to_string(address) + " is outside memory");
    return static_cast<Location>(address);
}

Word& Interpreter::lowerAccumulator(const Instruction& instruction)
{
    if (instruction.accumulator == 0)
        throw Error(ErrorKind::InvalidOperand,
                    std::string(to_string(instruction.function)) + " needs an accumulator pair; accumulator 0 has none");
    return store.accumulator(instruction.accumulator - 1);
}

DoubleWord Interpreter::accumulatorPair(const Instruction& instruction)
{
    return DoubleWord{lowerAccumulator(instruction), accumulator(instruction)};
}

void Interpreter::storePair(const Instruction& instruction, const DoubleWord& pair)
{
    lowerAccumulator(instruction) = pair.high;
    accumulator(instruction) = pair.low;
}

// =============================================================================
// ARITHMETIC AND LOGIC
// =============================================================================

template <Interpreter::BinaryOp Op>
void Interpreter::execAccumulate(const Instruction& instruction)
{
    Word& acc = accumulator(instruction);
    acc = Op(acc, operand(instruction));
}

template <Interpreter::BinaryOp Op>
void Interpreter::execAccumulateAndSwap(const Instruction& instruction)
{
    Word& acc = accumulator(instruction);
    Word result = Op(acc, operand(instruction));
    Word& target = direct(instruction);
    acc = result;
    std::swap(acc, target);
}

template <Word (Word::*Op)(IntType) const>
void Interpreter::execShift(const Instruction& instruction)
{
    Word& acc = accumulator(instruction);
    acc = (acc.*Op)(operand(instruction).toInteger());
}

template <DoubleWord (DoubleWord::*Op)(IntType) const>
void Interpreter::execDoubleShift(const Instruction& instruction)
{
    const DoubleWord pair = accumulatorPair(instruction);
    storePair(instruction, (pair.*Op)(operand(instruction).toInteger()));
}

template <DoubleWord (DoubleWord::*Op)(const Word&) const>
void Interpreter::execDoubleArithmetic(const Instruction& instruction)
{
    const DoubleWord pair = accumulatorPair(instruction);
    storePair(instruction, (pair.*Op)(operand(instruction)));
}

void Interpreter::execNil(const Instruction&)
{
}

void Interpreter::execTake(const Instruction& instruction)
{
    accumulator(instruction) = operand(instruction);
}

void Interpreter::execTstr(const Instruction& instruction)
{
    Word& lower = lowerAccumulator(instruction);
    const Word value = operand(instruction);
    const Word flag = Word::wrapInteger(value.compare(ONE) < 0 ? -1 : 0);
    lower = flag;
    accumulator(instruction) = value;
}

void Interpreter::execTneg(const Instruction& instruction)
{
    accumulator(instruction) = -operand(instruction);
}

void Interpreter::execTnot(const Instruction& instruction)
{
    accumulator(instruction) = ~operand(instruction);
}

void Interpreter::execTtyp(const Instruction& instruction)
{
    accumulator(instruction) = Word::wrapInteger(operand(instruction).typeCode());
}

void Interpreter::execTtyz(const Instruction& instruction)
{
    accumulator(instruction) = operand(instruction).bitsAsInteger();
}

void Interpreter::execTout(const Instruction& instruction)
{
    const Word& value = operand(instruction);
    if (value.isUndefined())
        throw Error(ErrorKind::InvalidOperand, "TOUT of an undefined word");
    const auto code = static_cast<uint8_t>(value.bits() & CharSet::CODE_MASK);
    auto c = CharSet::toChar(code);
    if (!c)
        throw Error(ErrorKind::InvalidSWordValue, "character code " + std::to_string(code) + " has no character");
    output.put(*c);
}

// =============================================================================
// SKIPS
// =============================================================================

void Interpreter::execSkip(const Instruction&)
{
    ++pc;
}

void Interpreter::execSkae(const Instruction& instruction)
{
    skipIf(accumulator(instruction).sameValue(operand(instruction)));
}

void Interpreter::execSkan(const Instruction& instruction)
{
    skipIf(!accumulator(instruction).sameValue(operand(instruction)));
}

void Interpreter::execSket(const Instruction& instruction)
{
    const Word& acc = accumulator(instruction);
    const Word& value = operand(instruction);
    if (acc.isUndefined() || value.isUndefined())
        throw Error(ErrorKind::InvalidOperand, "SKET on an undefined word");
    skipIf(acc.type() == value.type());
}

void Interpreter::execSkal(const Instruction& instruction)
{
    skipIf(accumulator(instruction).compare(operand(instruction)) < 0);
}

void Interpreter::execSkag(const Instruction& instruction)
{
    skipIf(accumulator(instruction).compare(operand(instruction)) > 0);
}

void Interpreter::execSked(const Instruction& instruction)
{
    Word& acc = accumulator(instruction);
    if (acc.sameValue(operand(instruction)))
        ++pc;
    else
        acc = acc - ONE;
}

void Interpreter::execSkei(const Instruction& instruction)
{
    Word& acc = accumulator(instruction);
    if (acc.sameValue(operand(instruction)))
        ++pc;
    else
        acc = acc + ONE;
}

// =============================================================================
// STORES
// =============================================================================

void Interpreter::execNilx(const Instruction& instruction)
{
    std::swap(accumulator(instruction), direct(instruction));
}

void Interpreter::execPut(const Instruction& instruction)
{
    direct(instruction) = accumulator(instruction);
}

void Interpreter::execPsqu(const Instruction& instruction)
{
    const Word squashed = accumulatorPair(instruction).squash();
    direct(instruction) = squashed;
}

void Interpreter::execPneg(const Instruction& instruction)
{
    const Word negated = -accumulator(instruction);
    direct(instruction) = negated;
}

void Interpreter::execPnot(const Instruction& instruction)
{
    const Word inverted = ~accumulator(instruction);
    direct(instruction) = inverted;
}

void Interpreter::execPtyp(const Instruction& instruction)
{
    const Word& acc = accumulator(instruction);
    if (acc.isUndefined())
        throw Error(ErrorKind::InvalidOperand, "PTYP of an undefined word");
    Word& target = direct(instruction);
    target = target.withType(acc.type());
}

void Interpreter::execPtyz(const Instruction& instruction)
{
    const Word bits = accumulator(instruction).bitsAsInteger();
    Word& target = direct(instruction);
    target = Word(target.isUndefined() ? WordType::IWord : target.type(), bits.bits());
}

void Interpreter::execPin(const Instruction& instruction)
{
    Word& target = direct(instruction);
    const int c = input.get();
    if (c == std::char_traits<char>::eof()) {
        output << "DATA*";
        return;
    }
    const Word character = Word::fromString(std::string(1, static_cast<char>(c)));
    output.put(static_cast<char>(c));
    target = character;
}

// =============================================================================
// JUMPS
// =============================================================================

void Interpreter::execJump(const Instruction& instruction)
{
    const Location target = effectiveAddress(instruction);
    if (instruction.accumulator != 0)
        lowerAccumulator(instruction) = Word::wrapInteger(static_cast<IntType>(pc - 1));
    pc = target;
}

void Interpreter::execJez(const Instruction& instruction)
{
    const Location target = effectiveAddress(instruction);
    if (accumulator(instruction).compare(ZERO) == 0)
        pc = target;
}

void Interpreter::execJnz(const Instruction& instruction)
{
    const Location target = effectiveAddress(instruction);
    if (accumulator(instruction).compare(ZERO) != 0)
        pc = target;
}

void Interpreter::execJlz(const Instruction& instruction)
{
    const Location target = effectiveAddress(instruction);
    if (accumulator(instruction).compare(ZERO) < 0)
        pc = target;
}

void Interpreter::execJgz(const Instruction& instruction)
{
    const Location target = effectiveAddress(instruction);
    if (accumulator(instruction).compare(ZERO) > 0)
        pc = target;
}

void Interpreter::execDecr(const Instruction& instruction)
{
    Word& target = store[effectiveAddress(instruction)];
    target = target - ONE;
}

void Interpreter::execIncr(const Instruction& instruction)
{
    Word& target = store[effectiveAddress(instruction)];
    target = target + ONE;
}

void Interpreter::execUnsupported(const Instruction& instruction)
{
    throw Error(ErrorKind::UnsupportedFunction,
                std::string(to_string(instruction.function)) + " is not supported");
}

// =============================================================================
// LIBRARY ROUTINES
// =============================================================================

void Interpreter::execExtra(const Instruction& instruction)
{
    if (instruction.address == 0 || instruction.address >= LIBRARY_ROUTINE_COUNT)
        throw Error(ErrorKind::UnsupportedFunction,
                    "EXTRA " + std::to_string(instruction.address) + " is not a library routine");

    Word& acc = accumulator(instruction);
    switch (static_cast<LibraryRoutine>(instruction.address)) {
        case LibraryRoutine::SQRT: acc = floatResult(std::sqrt(acc.toFloat())); break;
        case LibraryRoutine::LN: acc = floatResult(std::log(acc.toFloat())); break;
        case LibraryRoutine::EXP: acc = floatResult(std::exp(acc.toFloat())); break;
        case LibraryRoutine::SIN: acc = floatResult(std::sin(acc.toFloat())); break;
        case LibraryRoutine::COS: acc = floatResult(std::cos(acc.toFloat())); break;
        case LibraryRoutine::TAN: acc = floatResult(std::tan(acc.toFloat())); break;
        case LibraryRoutine::ATN: acc = floatResult(std::atan(acc.toFloat())); break;
        case LibraryRoutine::FLOAT: acc = floatResult(acc.toFloat()); break;
        case LibraryRoutine::FRAC: {
            const FloatType value = acc.toFloat();
            acc = floatResult(value - std::trunc(value));
            break;
        }
        case LibraryRoutine::INT: {
            const FloatType value = std::trunc(acc.toFloat());
            if (value < static_cast<FloatType>(IWORD_MIN) || value > static_cast<FloatType>(IWORD_MAX))
                throw Error(ErrorKind::InvalidIWordValue, "INT of " + acc.to_string() + " does not fit an I-word");
            acc = Word::fromInteger(static_cast<IntType>(value));
            break;
        }
        case LibraryRoutine::ABS:
            if (acc.isFloat())
                acc = Word(WordType::FWord, acc.bits() & ~FWORD_SIGN_MASK);
            else if (acc.compare(ZERO) < 0)
                acc = -acc;
            break;
        case LibraryRoutine::READ: {
            input >> std::ws;
            if (input.peek() == std::char_traits<char>::eof()) {
                output << "DATA*";
                break;
            }
            acc = readNumber();
            break;
        }
        case LibraryRoutine::PRINT: printWord(acc); break;
        case LibraryRoutine::CAPTN: writeCharacters(acc); break;
        case LibraryRoutine::STOP: stopped = true; break;
        case LibraryRoutine::LINE: output.put('\n'); break;
        case LibraryRoutine::PAGE: output.put('\f'); break;
        case LibraryRoutine::RND: acc = randomFraction(); break;
        case LibraryRoutine::NONE: break;
    }
}

Word Interpreter::readNumber()
{
    std::string text;
    while (true) {
        const int c = input.peek();
        if (c == std::char_traits<char>::eof())
            break;
        const char ch = static_cast<char>(c);
        if (!(std::isdigit(static_cast<unsigned char>(ch)) || ch == '+' || ch == '-' || ch == '.' || ch == '@'))
            break;
        text += ch;
        input.get();
    }

    const bool isFloat = text.find_first_of(".@") != std::string::npos;
    std::string number = text;
    for (auto& ch : number)
        if (ch == '@') ch = 'e';

    const Error unreadable(ErrorKind::InvalidOperand, "READ: cannot read a number from \"" + text + "\"");
    std::size_t used = 0;
    try {
        if (isFloat) {
            const FloatType value = std::stod(number, &used);
            if (used != number.size())
                throw unreadable;
            return Word::fromFloat(value);
        }
        const IntType value = std::stoll(number, &used);
        if (used != number.size())
            throw unreadable;
        return Word::fromInteger(value);
    } catch (const std::invalid_argument&) {
        throw unreadable;
    } catch (const std::out_of_range&) {
        throw Error(ErrorKind::InvalidOperand, "READ: number " + text + " is out of range");
    }
}

void Interpreter::printWord(const Word& word)
{
    if (word.isUndefined())
        throw Error(ErrorKind::InvalidOperand, "PRINT of an undefined word");
    if (word.isString())
        writeCharacters(word);
    else
        output << word.to_string();
}

void Interpreter::writeCharacters(const Word& word)
{
    if (!word.isString())
        throw Error(ErrorKind::InvalidOperand, "CAPTN needs an S-word, not " + std::string(to_string(word.type())));
    for (char c : word.stringValue()) {
        if (c != '\0')
            output.put(c);
    }
}

Word Interpreter::randomFraction()
{
    // Multiples of 2^-16 are exact F-words.
    std::uniform_int_distribution<int> steps(0, (1 << FWORD_MANTISSA_BITS) - 1);
    return Word::fromFloat(std::ldexp(static_cast<FloatType>(steps(random)), -static_cast<int>(FWORD_MANTISSA_BITS)));
}

// =============================================================================
// TRACE
// =============================================================================

void Interpreter::trace(Location at, const Instruction& instruction)
{
    std::ostream& os = *traceStream;
    std::string_view name = to_string(instruction.function);
    if (instruction.function == Function::EXTRA && instruction.address > 0 && instruction.address < LIBRARY_ROUTINE_COUNT)
        name = to_string(static_cast<LibraryRoutine>(instruction.address));

    os << std::setw(4) << std::setfill('0') << at << ' '
       << std::left << std::setw(6) << std::setfill(' ') << name << std::right
       << instruction.accumulator << ' '
       << std::setw(4) << std::setfill('0') << instruction.address << ' '
       << store[instruction.accumulator].to_string() << '\n';
}

void Interpreter::dump(std::ostream& os) const
{
    os << "HALT " << std::setw(4) << std::setfill('0') << pc << '\n';
    for (Location location = 0; location < store.size(); ++location) {
        const Word& word = store[location];
        if (word.isUndefined())
            continue;
        os << std::setw(4) << std::setfill('0') << location << ' ';
        if (word.isInstruction())
            os << Instruction::decode(word).to_string();
        else
            os << word.to_string();
        os << '\n';
    }
}

} // namespace bbcx

/**
 * =============================================================================
 * UncertaintyJNI.cpp - Java Native Interface Bridge to the Scoring Library
 * =============================================================================
 *
 * The active-learning loop runs in Java: it holds the unlabeled pool,
 * gets model outputs, and queues examples for labeling. This bridge lets
 * that loop call the C++ softmax and uncertainty metrics directly.
 *
 * JAVA SIDE:
 * ```java
 * package ai.activelearning;
 *
 * public class UncertaintySampler {
 *     static { System.loadLibrary("uncertainty_jni"); }
 *
 *     public native float[] nativeSoftmax(float[] scores, float base);
 *     public native float nativeScore(float[] probs, String method, boolean sorted);
 *     public native float nativeScoreLogits(float[] logits, String method);
 * }
 * ```
 *
 * NAMING CONVENTION:
 * Java method: ai.activelearning.UncertaintySampler.nativeScore(...)
 * C function:  Java_ai_activelearning_UncertaintySampler_nativeScore
 *
 * STATE:
 * Unlike an inference engine there is no model to load, so nothing is
 * cached between calls. Each call builds what it needs on the stack, which
 * also means any number of Java threads can call in at once.
 *
 * @file UncertaintyJNI.cpp
 * @author Multi-Language AI System
 * @version 2.0.0
 */

#include <jni.h>

#include <stdexcept>  // std::invalid_argument, std::domain_error, std::runtime_error
#include <string>
#include <vector>

#include "Softmax.hpp"
#include "UncertaintyScorer.hpp"

// ============================================================================
// HELPER FUNCTIONS
// ============================================================================

namespace {

/**
 * Throws a Java exception of the given class from C++ code.
 *
 * C++ exceptions cannot cross the JNI boundary, so every exported
 * function catches and converts them here. After this returns, the
 * caller must return to Java immediately.
 *
 * @param env       JNI environment
 * @param className Fully-qualified class name with "/" separators
 * @param message   Exception message
 */
void throwJava(JNIEnv* env, const char* className, const std::string& message) {
    // Keep an exception the JVM already raised (e.g. OutOfMemoryError)
    if (env->ExceptionCheck()) {
        return;
    }
    jclass exClass = env->FindClass(className);
    if (exClass != nullptr) {
        env->ThrowNew(exClass, message.c_str());
    }
    // If FindClass failed it already left a NoClassDefFoundError pending
}

void throwIllegalArgument(JNIEnv* env, const std::string& message) {
    throwJava(env, "java/lang/IllegalArgumentException", message);
}

void throwRuntime(JNIEnv* env, const std::string& message) {
    throwJava(env, "java/lang/RuntimeException", message);
}

/**
 * Copies a Java float[] into a std::vector.
 *
 * GetFloatArrayRegion() always copies, so nothing has to be released.
 *
 * @throws std::invalid_argument if the array is null
 */
std::vector<float> toVector(JNIEnv* env, jfloatArray array, const char* what) {
    if (!array) {
        throw std::invalid_argument(std::string(what) + " is null");
    }
    jsize length = env->GetArrayLength(array);
    std::vector<float> values(static_cast<size_t>(length));
    if (length > 0) {
        env->GetFloatArrayRegion(array, 0, length, values.data());
    }
    return values;
}

/**
 * Converts a Java String to std::string.
 *
 * @throws std::invalid_argument if the string is null
 */
std::string toString(JNIEnv* env, jstring str, const char* what) {
    if (!str) {
        throw std::invalid_argument(std::string(what) + " is null");
    }
    const char* chars = env->GetStringUTFChars(str, nullptr);
    if (!chars) {
        // OutOfMemoryError is already pending
        throw std::runtime_error(std::string("could not read ") + what);
    }
    std::string result(chars);
    env->ReleaseStringUTFChars(str, chars);
    return result;
}

/**
 * Builds a scorer for a method name passed from Java.
 */
UncertaintyScorer makeScorer(JNIEnv* env, jstring method) {
    ScorerConfig config;
    config.method = UncertaintyScorer::parseMethod(toString(env, method, "method"));
    return UncertaintyScorer(config);
}

} // namespace

// ============================================================================
// JNI EXPORTED FUNCTIONS
// ============================================================================

extern "C" {

/**
 * Java signature: public native float[] nativeSoftmax(float[] scores, float base);
 *
 * Plain (unshifted) softmax, same contract as SoftmaxUtils::softmax().
 *
 * @return jfloatArray of probabilities, or nullptr with an exception pending
 */
JNIEXPORT jfloatArray JNICALL
Java_ai_activelearning_UncertaintySampler_nativeSoftmax(
    JNIEnv* env,
    jobject /* this */,
    jfloatArray scoresArray,
    jfloat base
) {
    try {
        std::vector<float> scores = toVector(env, scoresArray, "scores");
        std::vector<float> probabilities = SoftmaxUtils::softmax(scores, base);

        jfloatArray output = env->NewFloatArray(static_cast<jsize>(probabilities.size()));
        if (!output) {
            throwRuntime(env, "Failed to allocate float array for probabilities");
            return nullptr;
        }

        env->SetFloatArrayRegion(
            output,
            0,
            static_cast<jsize>(probabilities.size()),
            probabilities.data()
        );
        return output;

    } catch (const std::invalid_argument& e) {
        throwIllegalArgument(env, e.what());
        return nullptr;
    } catch (const std::exception& e) {
        throwRuntime(env, e.what());
        return nullptr;
    }
}

/**
 * Java signature: public native float nativeScore(float[] probs, String method, boolean sorted);
 *
 * @param method "margin", "ratio", "least" or "entropy" (any case)
 * @return Uncertainty score, or 0 with an exception pending
 */
JNIEXPORT jfloat JNICALL
Java_ai_activelearning_UncertaintySampler_nativeScore(
    JNIEnv* env,
    jobject /* this */,
    jfloatArray probsArray,
    jstring method,
    jboolean sorted
) {
    try {
        std::vector<float> probs = toVector(env, probsArray, "probs");
        UncertaintyScorer scorer = makeScorer(env, method);
        return scorer.score(probs, sorted == JNI_TRUE);

    } catch (const std::invalid_argument& e) {
        throwIllegalArgument(env, e.what());
    } catch (const std::domain_error& e) {
        throwIllegalArgument(env, e.what());
    } catch (const std::exception& e) {
        throwRuntime(env, e.what());
    }
    return 0.0f;
}

/**
 * Java signature: public native float nativeScoreLogits(float[] logits, String method);
 *
 * Applies the overflow-safe softmax with base e, then scores.
 *
 * @return Uncertainty score, or 0 with an exception pending
 */
JNIEXPORT jfloat JNICALL
Java_ai_activelearning_UncertaintySampler_nativeScoreLogits(
    JNIEnv* env,
    jobject /* this */,
    jfloatArray logitsArray,
    jstring method
) {
    try {
        std::vector<float> logits = toVector(env, logitsArray, "logits");
        UncertaintyScorer scorer = makeScorer(env, method);
        return scorer.scoreLogits(logits);

    } catch (const std::invalid_argument& e) {
        throwIllegalArgument(env, e.what());
    } catch (const std::domain_error& e) {
        throwIllegalArgument(env, e.what());
    } catch (const std::exception& e) {
        throwRuntime(env, e.what());
    }
    return 0.0f;
}

} // extern "C"

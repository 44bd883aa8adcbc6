// Copyright (C) 2023 THL A29 Limited, a Tencent company. All rights reserved.
//
// Licensed under the BSD 3-Clause License (the "License"); you may not use this
// file except in compliance with the License. You may obtain a copy of the
// License at
//
// https://opensource.org/licenses/BSD-3-Clause
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS, WITHOUT
// WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied. See the
// License for the specific language governing permissions and limitations under
// the License.

#ifndef STOWAGE_TESTING_MAIN_H_
#define STOWAGE_TESTING_MAIN_H_

namespace stowage::testing {

// Initializes gflags / glog, and runs all tests.
int InitAndRunAllTests(int* argc, char** argv);

#define STOWAGE_TEST_MAIN                                       \
  int main(int argc, char** argv) {                             \
    return ::stowage::testing::InitAndRunAllTests(&argc, argv); \
  }

}  // namespace stowage::testing

#endif  // STOWAGE_TESTING_MAIN_H_
